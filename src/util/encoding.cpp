#include <uidkit/encoding.hpp>
#include <boost/json.hpp>

namespace uidkit {

std::string marshal_text(const Uuid& u) {
    return u.to_string();
}

Status unmarshal_text(const std::string& text, Uuid& out) {
    auto r = Uuid::from_string(text);
    UIDKIT_TRY(r);
    out = std::move(r).value();
    return ok_status();
}

std::string marshal_json(const Uuid& u) {
    return boost::json::serialize(boost::json::string(u.to_string()));
}

Status unmarshal_json(const std::string& json, Uuid& out) {
    boost::json::error_code ec;
    boost::json::value jv = boost::json::parse(json, ec);
    if (!ec && jv.is_null()) {
        return ok_status();
    }
    if (ec || !jv.is_string()) {
        return UidError{UidError::InvalidFormat,
            "invalid json value for uuid (must be string or null): " + json};
    }

    const boost::json::string& str = jv.as_string();
    return unmarshal_text(std::string(str.data(), str.size()), out);
}

std::vector<uint8_t> marshal_binary(const Uuid& u) {
    const std::string& s = u.to_string();
    return std::vector<uint8_t>(s.begin(), s.end());
}

Status unmarshal_binary(const std::vector<uint8_t>& data, Uuid& out) {
    return unmarshal_text(std::string(data.begin(), data.end()), out);
}

} // namespace uidkit
