#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace coursedao {
namespace utils {

// Big-endian fixed-width integers, LEB128 lengths. Reads past the end throw
// std::runtime_error.
class ByteBuffer {
public:
    ByteBuffer() : readPos_(0) {}
    explicit ByteBuffer(const std::vector<uint8_t>& data) : data_(data), readPos_(0) {}

    void writeUint8(uint8_t value);
    void writeUint32(uint32_t value);
    void writeUint64(uint64_t value);
    void writeBool(bool value);
    void writeVarInt(uint64_t value);
    void writeString(const std::string& value);
    void writeStringList(const std::vector<std::string>& values);

    uint8_t readUint8();
    uint32_t readUint32();
    uint64_t readUint64();
    bool readBool();
    uint64_t readVarInt();
    std::string readString();
    std::vector<std::string> readStringList();

    const std::vector<uint8_t>& data() const { return data_; }
    size_t size() const { return data_.size(); }
    size_t remaining() const { return data_.size() - readPos_; }
    bool atEnd() const { return readPos_ >= data_.size(); }
    void reset() { readPos_ = 0; }
    void clear() { data_.clear(); readPos_ = 0; }

private:
    std::vector<uint8_t> data_;
    size_t readPos_;

    void checkRead(uint64_t bytes) const;
};

}
}
