#pragma once

#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>

namespace stakerep {
namespace utils {

// Big-endian binary buffer. Reads past the end throw std::runtime_error.
class ByteBuffer {
public:
    ByteBuffer();
    explicit ByteBuffer(const std::vector<uint8_t>& data);

    void writeUint8(uint8_t value);
    void writeUint32(uint32_t value);
    void writeUint64(uint64_t value);
    void writeInt64(int64_t value);
    void writeDouble(double value);
    void writeBool(bool value);
    void writeVarInt(uint64_t value);
    void writeString(const std::string& value);
    void writeStringList(const std::vector<std::string>& values);

    uint8_t readUint8();
    uint32_t readUint32();
    uint64_t readUint64();
    int64_t readInt64();
    double readDouble();
    bool readBool();
    uint64_t readVarInt();
    std::string readString();
    std::vector<std::string> readStringList();

    const std::vector<uint8_t>& data() const { return data_; }
    size_t size() const { return data_.size(); }
    size_t remaining() const { return data_.size() - readPos_; }
    size_t position() const { return readPos_; }
    void reset() { readPos_ = 0; }
    void clear() { data_.clear(); readPos_ = 0; }

private:
    std::vector<uint8_t> data_;
    size_t readPos_;

    void checkRead(uint64_t bytes) const;
};

}
}
