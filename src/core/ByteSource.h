#pragma once
#include <cstddef>
#include <string>

namespace testsum {

// A readable byte stream. read() blocks until data is available and returns
// 0 once the stream is exhausted (or interrupted). Errors are thrown.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual std::size_t read(char* buf, std::size_t len) = 0;
};

// Fixed in-memory stream, delivered in chunks of at most chunk_size bytes.
class StringSource : public ByteSource {
public:
    explicit StringSource(std::string data, std::size_t chunk_size = 4096)
        : data_(std::move(data)), chunk_size_(chunk_size ? chunk_size : 1) {}
    std::size_t read(char* buf, std::size_t len) override;
private:
    std::string data_;
    std::size_t chunk_size_;
    std::size_t pos_ = 0;
};

}
