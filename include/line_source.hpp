/**
 * Rewindable Line Sources
 *
 * Line-oriented input for the two-pass Stockholm reader:
 * - IstreamLineSource: std::istream (caller-owned or owned)
 * - GzLineSource: plain or gzip-compressed files via zlib
 * - BgzfLineSource: BGZF-compressed or plain files via htslib
 *
 * All sources strip the trailing "\n" or "\r\n" from each line and can be
 * rewound to the position where reading started.
 */

#ifndef STOCKHOLM_LINE_SOURCE_HPP
#define STOCKHOLM_LINE_SOURCE_HPP

#include <istream>
#include <memory>
#include <string>
#include <vector>

#include <zlib.h>

namespace stockholm {

/**
 * Remove a trailing "\n", then a trailing "\r"
 */
inline void strip_line_ending(std::string& line) {
    if (!line.empty() && line.back() == '\n') line.pop_back();
    if (!line.empty() && line.back() == '\r') line.pop_back();
}

/**
 * Abstract line source
 */
class LineSource {
public:
    virtual ~LineSource() = default;

    /**
     * Read the next line without its line terminator
     * @return false at end of input
     * @throws std::runtime_error on read errors
     */
    virtual bool next_line(std::string& line) = 0;

    /**
     * Return to the start of the input
     * @throws std::runtime_error if the input cannot be rewound
     */
    virtual void rewind() = 0;

    /**
     * Description of the input for log and error messages
     */
    virtual std::string name() const = 0;
};

// ============================================================================
// std::istream source
// ============================================================================

class IstreamLineSource : public LineSource {
public:
    /**
     * Read from a caller-owned stream; rewind() returns to the stream's
     * position at construction time
     */
    explicit IstreamLineSource(std::istream& in, std::string name = "<stream>");

    /**
     * Read from a stream this source owns
     */
    explicit IstreamLineSource(std::unique_ptr<std::istream> in, std::string name = "<stream>");

    bool next_line(std::string& line) override;
    void rewind() override;
    std::string name() const override { return name_; }

private:
    std::unique_ptr<std::istream> owned_;
    std::istream* in_;
    std::streampos start_;
    std::string name_;
};

// ============================================================================
// zlib source
// ============================================================================

class GzLineSource : public LineSource {
public:
    /**
     * Open a plain or gzip-compressed file
     * @throws std::runtime_error if the file cannot be opened
     */
    explicit GzLineSource(const std::string& path);
    ~GzLineSource() override;

    // Prevent copying
    GzLineSource(const GzLineSource&) = delete;
    GzLineSource& operator=(const GzLineSource&) = delete;

    bool next_line(std::string& line) override;
    void rewind() override;
    std::string name() const override { return path_; }

private:
    gzFile gz_;
    std::vector<char> buffer_;
    std::string path_;
};

// ============================================================================
// htslib BGZF source
// ============================================================================

/**
 * BGZF reader (requires htslib, compile with -DHAVE_HTSLIB)
 * Plain gzip files cannot be rewound through BGZF; use GzLineSource.
 */
class BgzfLineSource : public LineSource {
public:
    /**
     * @throws std::runtime_error if the file cannot be opened or htslib
     *         support was not compiled in
     */
    explicit BgzfLineSource(const std::string& path);
    ~BgzfLineSource() override;

    // Prevent copying
    BgzfLineSource(const BgzfLineSource&) = delete;
    BgzfLineSource& operator=(const BgzfLineSource&) = delete;

    bool next_line(std::string& line) override;
    void rewind() override;
    std::string name() const override { return path_; }

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl_;
    std::string path_;
};

/**
 * Check whether BgzfLineSource is usable in this build
 */
bool has_bgzf_support();

/**
 * Open a line source for a path
 * "-" reads stdin into memory, ".bgz" uses BGZF, anything else uses zlib
 * (which reads both plain and gzip-compressed files).
 */
std::unique_ptr<LineSource> open_line_source(const std::string& path);

} // namespace stockholm

#endif // STOCKHOLM_LINE_SOURCE_HPP
