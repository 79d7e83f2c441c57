#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// SNMPv1/v2c 报文的 BER 编解码，只覆盖 GET 往返需要的类型
namespace snmp {

constexpr int kVersion1  = 0;
constexpr int kVersion2c = 1;

enum class PduType : std::uint8_t {
    GetRequest     = 0xA0,
    GetNextRequest = 0xA1,
    Response       = 0xA2,
};

enum class ValueType : std::uint8_t {
    Integer        = 0x02,
    OctetString    = 0x04,
    Null           = 0x05,
    ObjectId       = 0x06,
    IpAddress      = 0x40,
    Counter32      = 0x41,
    Gauge32        = 0x42,
    TimeTicks      = 0x43,
    Opaque         = 0x44,
    Counter64      = 0x46,
    NoSuchObject   = 0x80,
    NoSuchInstance = 0x81,
    EndOfMibView   = 0x82,
};

struct Value {
    ValueType     type{ValueType::Null};
    std::int64_t  integer{};        // Integer
    std::uint64_t unsignedValue{};  // Counter32 / Gauge32 / TimeTicks / Counter64
    std::string   text;             // OctetString / Opaque 原始字节；ObjectId、IpAddress 为点分形式

    // Null 与三种 v2c 异常值都视为“无值”
    bool isAbsent() const;
    std::string toString() const;

    static Value null();
    static Value ofInteger(std::int64_t v);
    static Value ofUnsigned(ValueType type, std::uint64_t v);
    static Value ofString(std::string s);
    static Value exception(ValueType type);
};

struct VarBind {
    std::string oid;
    Value       value;
};

struct Message {
    int                  version{kVersion2c};
    std::string          community{"public"};
    PduType              pdu{PduType::GetRequest};
    std::int32_t         requestId{};
    std::int32_t         errorStatus{};
    std::int32_t         errorIndex{};
    std::vector<VarBind> varbinds;
};

class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// "1.3.6.1.2.1.1.3.0" -> {1,3,6,1,2,1,1,3,0}，格式错误抛出 std::invalid_argument
std::vector<std::uint32_t> parseOid(const std::string& dotted);
std::string formatOid(const std::vector<std::uint32_t>& arcs);

// 构造一次 GET 请求，每个 OID 的值为 NULL
Message makeGetRequest(const std::string& community,
                       std::int32_t requestId,
                       const std::vector<std::string>& oids);

std::vector<std::uint8_t> encode(const Message& msg);

// 报文不完整或不合法时抛出 DecodeError
Message decode(const std::uint8_t* data, std::size_t len);
inline Message decode(const std::vector<std::uint8_t>& buf) {
    return decode(buf.data(), buf.size());
}

const char* errorStatusName(std::int32_t status);

} // namespace snmp
