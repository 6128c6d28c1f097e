/**
 * Rewindable Line Sources - Implementation
 */

#include "line_source.hpp"
#include "logging.hpp"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>

#ifdef HAVE_HTSLIB
#include <htslib/bgzf.h>
#include <htslib/kstring.h>
#endif

namespace stockholm {

// ============================================================================
// IstreamLineSource Implementation
// ============================================================================

IstreamLineSource::IstreamLineSource(std::istream& in, std::string name)
    : in_(&in), start_(in.tellg()), name_(std::move(name)) {}

IstreamLineSource::IstreamLineSource(std::unique_ptr<std::istream> in, std::string name)
    : owned_(std::move(in)), in_(owned_.get()), start_(owned_->tellg()), name_(std::move(name)) {}

bool IstreamLineSource::next_line(std::string& line) {
    if (!std::getline(*in_, line)) {
        if (in_->bad()) {
            throw std::runtime_error("Read error on " + name_);
        }
        return false;
    }
    strip_line_ending(line);
    return true;
}

void IstreamLineSource::rewind() {
    if (start_ == std::streampos(-1)) {
        throw std::runtime_error("Input is not rewindable: " + name_);
    }
    in_->clear();
    in_->seekg(start_);
    if (in_->fail()) {
        throw std::runtime_error("Cannot rewind input: " + name_);
    }
}

// ============================================================================
// GzLineSource Implementation
// ============================================================================

GzLineSource::GzLineSource(const std::string& path)
    : gz_(nullptr), buffer_(65536), path_(path) {

    gz_ = gzopen(path.c_str(), "rb");
    if (!gz_) {
        throw std::runtime_error("Cannot open input file: " + path);
    }
}

GzLineSource::~GzLineSource() {
    if (gz_) gzclose(gz_);
}

bool GzLineSource::next_line(std::string& line) {
    line.clear();
    bool got_data = false;

    // gzgets stops at the buffer size, so long lines arrive in pieces
    while (gzgets(gz_, buffer_.data(), static_cast<int>(buffer_.size())) != nullptr) {
        got_data = true;
        size_t len = std::strlen(buffer_.data());
        line.append(buffer_.data(), len);
        if (!line.empty() && line.back() == '\n') break;

        // A short chunk without a newline before EOF means a NUL byte hid the rest
        if (len < buffer_.size() - 1 && !gzeof(gz_)) {
            throw std::runtime_error("Embedded NUL byte in " + path_);
        }
    }

    if (!got_data) {
        int errnum = Z_OK;
        const char* msg = gzerror(gz_, &errnum);
        if (errnum != Z_OK && errnum != Z_STREAM_END) {
            throw std::runtime_error("Error reading " + path_ + ": " + (msg ? msg : "unknown zlib error"));
        }
        return false;
    }

    strip_line_ending(line);
    return true;
}

void GzLineSource::rewind() {
    if (gzrewind(gz_) != 0) {
        throw std::runtime_error("Cannot rewind input file: " + path_);
    }
}

// ============================================================================
// BgzfLineSource Implementation
// ============================================================================

#ifdef HAVE_HTSLIB

struct BgzfLineSource::Impl {
    BGZF* fp = nullptr;
    kstring_t ks = {0, 0, nullptr};

    ~Impl() {
        free(ks.s);
        if (fp) bgzf_close(fp);
    }
};

BgzfLineSource::BgzfLineSource(const std::string& path)
    : pimpl_(std::make_unique<Impl>()), path_(path) {

    pimpl_->fp = bgzf_open(path.c_str(), "r");
    if (!pimpl_->fp) {
        throw std::runtime_error("Cannot open BGZF file: " + path);
    }
}

BgzfLineSource::~BgzfLineSource() = default;

bool BgzfLineSource::next_line(std::string& line) {
    int ret = bgzf_getline(pimpl_->fp, '\n', &pimpl_->ks);
    if (ret == -1) return false;
    if (ret < -1) {
        throw std::runtime_error("Error reading BGZF file: " + path_);
    }
    line.assign(pimpl_->ks.s, pimpl_->ks.l);
    strip_line_ending(line);
    return true;
}

void BgzfLineSource::rewind() {
    if (bgzf_seek(pimpl_->fp, 0, SEEK_SET) < 0) {
        throw std::runtime_error("Cannot rewind BGZF file: " + path_ +
                                 " (plain gzip input must be read through zlib)");
    }
}

bool has_bgzf_support() {
    return true;
}

#else  // No HTSLIB

struct BgzfLineSource::Impl {};

BgzfLineSource::BgzfLineSource(const std::string& path)
    : pimpl_(std::make_unique<Impl>()), path_(path) {
    log(LogLevel::WARNING, "BgzfLineSource requires htslib. Build with -DHAVE_HTSLIB");
    throw std::runtime_error("Cannot open BGZF file without htslib support: " + path);
}

BgzfLineSource::~BgzfLineSource() = default;

bool BgzfLineSource::next_line(std::string&) {
    throw std::runtime_error("BgzfLineSource requires htslib. Build with -DHAVE_HTSLIB");
}

void BgzfLineSource::rewind() {
    throw std::runtime_error("BgzfLineSource requires htslib. Build with -DHAVE_HTSLIB");
}

bool has_bgzf_support() {
    return false;
}

#endif  // HAVE_HTSLIB

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<LineSource> open_line_source(const std::string& path) {
    if (path == "-") {
        // stdin cannot seek, so buffer it for the second pass
        auto buffered = std::make_unique<std::istringstream>(
            std::string(std::istreambuf_iterator<char>(std::cin),
                        std::istreambuf_iterator<char>()));
        return std::make_unique<IstreamLineSource>(std::move(buffered), "<stdin>");
    }

    bool is_bgzf = (path.size() >= 4 && path.substr(path.size() - 4) == ".bgz");
    if (is_bgzf) {
        log(LogLevel::DEBUG, "Opening BGZF input: " + path);
        return std::make_unique<BgzfLineSource>(path);
    }

    log(LogLevel::DEBUG, "Opening input: " + path);
    return std::make_unique<GzLineSource>(path);
}

} // namespace stockholm
