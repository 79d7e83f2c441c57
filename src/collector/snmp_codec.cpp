#include "collector/snmp_codec.hpp"

#include <fmt/core.h>
#include <limits>

namespace snmp {

namespace {

constexpr std::uint8_t kTagSequence = 0x30;

/* ---------- 编码 ---------- */
void appendLength(std::vector<std::uint8_t>& out, std::size_t len)
{
    if (len < 0x80) {
        out.push_back(static_cast<std::uint8_t>(len));
        return;
    }
    std::uint8_t tmp[sizeof(std::size_t)];
    int n = 0;
    while (len) {
        tmp[n++] = static_cast<std::uint8_t>(len & 0xff);
        len >>= 8;
    }
    out.push_back(static_cast<std::uint8_t>(0x80 | n));
    while (n) out.push_back(tmp[--n]);
}

void appendTlv(std::vector<std::uint8_t>& out, std::uint8_t tag,
               const std::vector<std::uint8_t>& content)
{
    out.push_back(tag);
    appendLength(out, content.size());
    out.insert(out.end(), content.begin(), content.end());
}

std::vector<std::uint8_t> encodeSigned(std::int64_t v)
{
    std::vector<std::uint8_t> bytes(8);
    auto u = static_cast<std::uint64_t>(v);
    for (int i = 7; i >= 0; --i) {
        bytes[i] = static_cast<std::uint8_t>(u & 0xff);
        u >>= 8;
    }
    // 去掉多余的符号扩展字节
    std::size_t start = 0;
    while (start < 7) {
        auto b0 = bytes[start];
        auto b1 = bytes[start + 1];
        if ((b0 == 0x00 && !(b1 & 0x80)) || (b0 == 0xff && (b1 & 0x80)))
            ++start;
        else
            break;
    }
    return {bytes.begin() + static_cast<std::ptrdiff_t>(start), bytes.end()};
}

std::vector<std::uint8_t> encodeUnsigned(std::uint64_t v)
{
    std::vector<std::uint8_t> bytes;
    do {
        bytes.insert(bytes.begin(), static_cast<std::uint8_t>(v & 0xff));
        v >>= 8;
    } while (v);
    if (bytes.front() & 0x80) bytes.insert(bytes.begin(), 0x00);
    return bytes;
}

void appendBase128(std::vector<std::uint8_t>& out, std::uint32_t v)
{
    std::uint8_t tmp[5];
    int n = 0;
    do {
        tmp[n++] = static_cast<std::uint8_t>(v & 0x7f);
        v >>= 7;
    } while (v);
    while (n > 1) out.push_back(static_cast<std::uint8_t>(tmp[--n] | 0x80));
    out.push_back(tmp[0]);
}

std::vector<std::uint8_t> encodeOid(const std::vector<std::uint32_t>& arcs)
{
    std::vector<std::uint8_t> out;
    appendBase128(out, arcs[0] * 40 + arcs[1]);
    for (std::size_t i = 2; i < arcs.size(); ++i) appendBase128(out, arcs[i]);
    return out;
}

std::vector<std::uint8_t> encodeIpAddress(const std::string& dotted)
{
    std::vector<std::uint8_t> out;
    std::size_t pos = 0;
    while (pos <= dotted.size()) {
        auto dot = dotted.find('.', pos);
        auto part = dotted.substr(pos, dot == std::string::npos ? std::string::npos : dot - pos);
        if (part.empty() || part.size() > 3 ||
            part.find_first_not_of("0123456789") != std::string::npos) {
            throw std::invalid_argument("bad ip address '" + dotted + "'");
        }
        auto octet = std::stoul(part);
        if (octet > 255) throw std::invalid_argument("bad ip address '" + dotted + "'");
        out.push_back(static_cast<std::uint8_t>(octet));
        if (dot == std::string::npos) break;
        pos = dot + 1;
    }
    if (out.size() != 4) throw std::invalid_argument("bad ip address '" + dotted + "'");
    return out;
}

std::vector<std::uint8_t> encodeValue(const Value& v)
{
    std::vector<std::uint8_t> content;
    switch (v.type) {
        case ValueType::Integer:
            content = encodeSigned(v.integer);
            break;
        case ValueType::OctetString:
        case ValueType::Opaque:
            content.assign(v.text.begin(), v.text.end());
            break;
        case ValueType::ObjectId:
            content = encodeOid(parseOid(v.text));
            break;
        case ValueType::IpAddress:
            content = encodeIpAddress(v.text);
            break;
        case ValueType::Counter32:
        case ValueType::Gauge32:
        case ValueType::TimeTicks:
        case ValueType::Counter64:
            content = encodeUnsigned(v.unsignedValue);
            break;
        case ValueType::Null:
        case ValueType::NoSuchObject:
        case ValueType::NoSuchInstance:
        case ValueType::EndOfMibView:
            break;
    }
    std::vector<std::uint8_t> out;
    appendTlv(out, static_cast<std::uint8_t>(v.type), content);
    return out;
}

/* ---------- 解码 ---------- */
struct Tlv {
    std::uint8_t        tag{};
    const std::uint8_t* data{};
    std::size_t         len{};
};

class Reader {
public:
    Reader(const std::uint8_t* data, std::size_t len) : data_(data), len_(len) {}

    bool atEnd() const { return pos_ >= len_; }

    Tlv next()
    {
        if (pos_ + 2 > len_) throw DecodeError("truncated tlv header");
        Tlv tlv;
        tlv.tag = data_[pos_++];
        std::size_t len = data_[pos_++];
        if (len & 0x80) {
            std::size_t n = len & 0x7f;
            if (n == 0) throw DecodeError("indefinite length is not allowed");
            if (n > 4) throw DecodeError("length field too long");
            if (pos_ + n > len_) throw DecodeError("truncated length field");
            len = 0;
            for (std::size_t i = 0; i < n; ++i) len = (len << 8) | data_[pos_++];
        }
        if (len > len_ - pos_) {
            throw DecodeError(fmt::format("tlv 0x{:02x} claims {} bytes, {} left", tlv.tag, len, len_ - pos_));
        }
        tlv.data = data_ + pos_;
        tlv.len  = len;
        pos_ += len;
        return tlv;
    }

    Tlv expect(std::uint8_t tag, const char* what)
    {
        auto tlv = next();
        if (tlv.tag != tag) {
            throw DecodeError(fmt::format("expected {} (0x{:02x}), got 0x{:02x}", what, tag, tlv.tag));
        }
        return tlv;
    }

private:
    const std::uint8_t* data_;
    std::size_t         len_;
    std::size_t         pos_{0};
};

std::int64_t decodeSigned(const Tlv& tlv)
{
    if (tlv.len == 0 || tlv.len > 8) throw DecodeError(fmt::format("bad integer length {}", tlv.len));
    std::uint64_t u = (tlv.data[0] & 0x80) ? std::numeric_limits<std::uint64_t>::max() : 0;
    for (std::size_t i = 0; i < tlv.len; ++i) u = (u << 8) | tlv.data[i];
    return static_cast<std::int64_t>(u);
}

std::int32_t decodeInt32(const Tlv& tlv, const char* what)
{
    auto v = decodeSigned(tlv);
    if (v < std::numeric_limits<std::int32_t>::min() || v > std::numeric_limits<std::int32_t>::max()) {
        throw DecodeError(fmt::format("{} out of range", what));
    }
    return static_cast<std::int32_t>(v);
}

std::uint64_t decodeUnsigned(const Tlv& tlv)
{
    if (tlv.len == 0 || tlv.len > 9 || (tlv.len == 9 && tlv.data[0] != 0)) {
        throw DecodeError(fmt::format("bad unsigned length {}", tlv.len));
    }
    std::uint64_t u = 0;
    for (std::size_t i = 0; i < tlv.len; ++i) u = (u << 8) | tlv.data[i];
    return u;
}

std::string decodeOid(const Tlv& tlv)
{
    if (tlv.len == 0) throw DecodeError("empty object identifier");
    std::vector<std::uint32_t> arcs;
    std::uint64_t acc = 0;
    int groups = 0;
    for (std::size_t i = 0; i < tlv.len; ++i) {
        acc = (acc << 7) | (tlv.data[i] & 0x7f);
        if (++groups > 5 || acc > std::numeric_limits<std::uint32_t>::max()) {
            throw DecodeError("object identifier arc overflow");
        }
        if (tlv.data[i] & 0x80) continue;
        if (arcs.empty()) {
            auto first = static_cast<std::uint32_t>(acc);
            if (first < 40)      { arcs.push_back(0); arcs.push_back(first); }
            else if (first < 80) { arcs.push_back(1); arcs.push_back(first - 40); }
            else                 { arcs.push_back(2); arcs.push_back(first - 80); }
        } else {
            arcs.push_back(static_cast<std::uint32_t>(acc));
        }
        acc = 0;
        groups = 0;
    }
    if (groups != 0) throw DecodeError("truncated object identifier");
    return formatOid(arcs);
}

Value decodeValue(const Tlv& tlv)
{
    auto type = static_cast<ValueType>(tlv.tag);
    switch (type) {
        case ValueType::Integer:
            return Value::ofInteger(decodeSigned(tlv));
        case ValueType::OctetString:
        case ValueType::Opaque: {
            Value v = Value::ofString(std::string(reinterpret_cast<const char*>(tlv.data), tlv.len));
            v.type = type;
            return v;
        }
        case ValueType::Null:
            return Value::null();
        case ValueType::ObjectId: {
            Value v;
            v.type = ValueType::ObjectId;
            v.text = decodeOid(tlv);
            return v;
        }
        case ValueType::IpAddress: {
            if (tlv.len != 4) throw DecodeError("ip address must be 4 bytes");
            Value v;
            v.type = ValueType::IpAddress;
            v.text = fmt::format("{}.{}.{}.{}", tlv.data[0], tlv.data[1], tlv.data[2], tlv.data[3]);
            return v;
        }
        case ValueType::Counter32:
        case ValueType::Gauge32:
        case ValueType::TimeTicks:
        case ValueType::Counter64:
            return Value::ofUnsigned(type, decodeUnsigned(tlv));
        case ValueType::NoSuchObject:
        case ValueType::NoSuchInstance:
        case ValueType::EndOfMibView:
            return Value::exception(type);
    }
    throw DecodeError(fmt::format("unsupported value type 0x{:02x}", tlv.tag));
}

} // namespace

/* ---------- Value ---------- */
bool Value::isAbsent() const
{
    return type == ValueType::Null || type == ValueType::NoSuchObject ||
           type == ValueType::NoSuchInstance || type == ValueType::EndOfMibView;
}

std::string Value::toString() const
{
    switch (type) {
        case ValueType::Integer:
            return std::to_string(integer);
        case ValueType::Counter32:
        case ValueType::Gauge32:
        case ValueType::TimeTicks:
        case ValueType::Counter64:
            return std::to_string(unsignedValue);
        case ValueType::OctetString:
        case ValueType::Opaque:
        case ValueType::ObjectId:
        case ValueType::IpAddress:
            return text;
        default:
            return {};
    }
}

Value Value::null()
{
    return Value{};
}

Value Value::ofInteger(std::int64_t v)
{
    Value out;
    out.type = ValueType::Integer;
    out.integer = v;
    return out;
}

Value Value::ofUnsigned(ValueType type, std::uint64_t v)
{
    Value out;
    out.type = type;
    out.unsignedValue = v;
    return out;
}

Value Value::ofString(std::string s)
{
    Value out;
    out.type = ValueType::OctetString;
    out.text = std::move(s);
    return out;
}

Value Value::exception(ValueType type)
{
    Value out;
    out.type = type;
    return out;
}

/* ---------- OID ---------- */
std::vector<std::uint32_t> parseOid(const std::string& dotted)
{
    std::string s = dotted;
    if (!s.empty() && s.front() == '.') s.erase(0, 1);
    if (s.empty()) throw std::invalid_argument("empty oid");

    std::vector<std::uint32_t> arcs;
    std::size_t pos = 0;
    while (true) {
        auto dot = s.find('.', pos);
        auto part = s.substr(pos, dot == std::string::npos ? std::string::npos : dot - pos);
        if (part.empty() || part.size() > 10 ||
            part.find_first_not_of("0123456789") != std::string::npos) {
            throw std::invalid_argument("bad arc '" + part + "'");
        }
        auto v = std::stoull(part);
        if (v > std::numeric_limits<std::uint32_t>::max()) {
            throw std::invalid_argument("arc out of range '" + part + "'");
        }
        arcs.push_back(static_cast<std::uint32_t>(v));
        if (dot == std::string::npos) break;
        pos = dot + 1;
    }
    if (arcs.size() < 2) throw std::invalid_argument("oid needs at least two arcs");
    if (arcs[0] > 2) throw std::invalid_argument("first arc must be 0, 1 or 2");
    if (arcs[0] < 2 && arcs[1] > 39) throw std::invalid_argument("second arc must be below 40");
    if (arcs[0] == 2 && arcs[1] > std::numeric_limits<std::uint32_t>::max() - 80) {
        throw std::invalid_argument("second arc out of range");
    }
    return arcs;
}

std::string formatOid(const std::vector<std::uint32_t>& arcs)
{
    std::string out;
    for (std::size_t i = 0; i < arcs.size(); ++i) {
        if (i) out.push_back('.');
        out += std::to_string(arcs[i]);
    }
    return out;
}

/* ---------- 报文 ---------- */
Message makeGetRequest(const std::string& community,
                       std::int32_t requestId,
                       const std::vector<std::string>& oids)
{
    Message msg;
    msg.community = community;
    msg.pdu = PduType::GetRequest;
    msg.requestId = requestId;
    msg.varbinds.reserve(oids.size());
    for (const auto& oid : oids) msg.varbinds.push_back({oid, Value::null()});
    return msg;
}

std::vector<std::uint8_t> encode(const Message& msg)
{
    std::vector<std::uint8_t> varbinds;
    for (const auto& vb : msg.varbinds) {
        std::vector<std::uint8_t> entry;
        appendTlv(entry, static_cast<std::uint8_t>(ValueType::ObjectId), encodeOid(parseOid(vb.oid)));
        auto value = encodeValue(vb.value);
        entry.insert(entry.end(), value.begin(), value.end());
        appendTlv(varbinds, kTagSequence, entry);
    }

    std::vector<std::uint8_t> pdu;
    appendTlv(pdu, static_cast<std::uint8_t>(ValueType::Integer), encodeSigned(msg.requestId));
    appendTlv(pdu, static_cast<std::uint8_t>(ValueType::Integer), encodeSigned(msg.errorStatus));
    appendTlv(pdu, static_cast<std::uint8_t>(ValueType::Integer), encodeSigned(msg.errorIndex));
    appendTlv(pdu, kTagSequence, varbinds);

    std::vector<std::uint8_t> body;
    appendTlv(body, static_cast<std::uint8_t>(ValueType::Integer), encodeSigned(msg.version));
    appendTlv(body, static_cast<std::uint8_t>(ValueType::OctetString),
              std::vector<std::uint8_t>(msg.community.begin(), msg.community.end()));
    appendTlv(body, static_cast<std::uint8_t>(msg.pdu), pdu);

    std::vector<std::uint8_t> out;
    appendTlv(out, kTagSequence, body);
    return out;
}

Message decode(const std::uint8_t* data, std::size_t len)
{
    Reader top(data, len);
    auto outer = top.expect(kTagSequence, "message sequence");
    if (!top.atEnd()) throw DecodeError("trailing bytes after message");

    Message msg;
    Reader body(outer.data, outer.len);
    msg.version = decodeInt32(body.expect(static_cast<std::uint8_t>(ValueType::Integer), "version"), "version");
    auto community = body.expect(static_cast<std::uint8_t>(ValueType::OctetString), "community");
    msg.community.assign(reinterpret_cast<const char*>(community.data), community.len);

    auto pdu = body.next();
    if (pdu.tag != static_cast<std::uint8_t>(PduType::GetRequest) &&
        pdu.tag != static_cast<std::uint8_t>(PduType::GetNextRequest) &&
        pdu.tag != static_cast<std::uint8_t>(PduType::Response)) {
        throw DecodeError(fmt::format("unsupported pdu type 0x{:02x}", pdu.tag));
    }
    msg.pdu = static_cast<PduType>(pdu.tag);

    const auto intTag = static_cast<std::uint8_t>(ValueType::Integer);
    Reader fields(pdu.data, pdu.len);
    msg.requestId   = decodeInt32(fields.expect(intTag, "request-id"), "request-id");
    msg.errorStatus = decodeInt32(fields.expect(intTag, "error-status"), "error-status");
    msg.errorIndex  = decodeInt32(fields.expect(intTag, "error-index"), "error-index");

    auto list = fields.expect(kTagSequence, "varbind list");
    Reader vbs(list.data, list.len);
    while (!vbs.atEnd()) {
        auto entry = vbs.expect(kTagSequence, "varbind");
        Reader vb(entry.data, entry.len);
        VarBind out;
        out.oid = decodeOid(vb.expect(static_cast<std::uint8_t>(ValueType::ObjectId), "varbind oid"));
        out.value = decodeValue(vb.next());
        msg.varbinds.push_back(std::move(out));
    }
    return msg;
}

const char* errorStatusName(std::int32_t status)
{
    static const char* const names[] = {
        "noError", "tooBig", "noSuchName", "badValue", "readOnly", "genErr",
        "noAccess", "wrongType", "wrongLength", "wrongEncoding", "wrongValue",
        "noCreation", "inconsistentValue", "resourceUnavailable", "commitFailed",
        "undoFailed", "authorizationError", "notWritable", "inconsistentName",
    };
    if (status < 0 || status >= static_cast<std::int32_t>(sizeof(names) / sizeof(names[0]))) {
        return "unknownError";
    }
    return names[status];
}

} // namespace snmp
