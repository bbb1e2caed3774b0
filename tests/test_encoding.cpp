#include <catch2/catch.hpp>
#include <uidkit/encoding.hpp>
#include <string>
#include <utility>
#include <vector>

using namespace uidkit;

// input -> canonical output after a decode/encode cycle
static const std::vector<std::pair<std::string, std::string>> ROUNDTRIPS = {
    {"", ""},
    {"00000000-0000-0000-0000-000000000000", ""},
    {"afe40693-8f63-4766-85f1-250a427f1db5", "afe40693-8f63-4766-85f1-250a427f1db5"},
    {"AFE40693-8F63-4766-85F1-250a427F1DB5", "afe40693-8f63-4766-85f1-250a427f1db5"},
};

static const std::vector<std::string> MALFORMED = {
    "asda",
    "gfe40693-8f63-4766-85f1-250a427f1db5",
    "afe406938f63476685f1250a427f1db5",
    "afe40693-8f63-4766-85f1-250a427f1db51",
    "afe406938-f63-4766-85f1-250a427f1db5",
    "99999999-9999-6999-9999-250a427f1db5",
    "99999999-9999-4999-1999-250a427f1db5",
};

// ===== text =====

TEST_CASE("text roundtrip", "[encoding]") {
    for (const auto& [in, want] : ROUNDTRIPS) {
        Uuid u;
        REQUIRE(unmarshal_text(in, u).is_ok());
        REQUIRE(marshal_text(u) == want);
    }
}

TEST_CASE("text unmarshal rejects malformed input", "[encoding]") {
    for (const auto& in : MALFORMED) {
        Uuid u = Uuid::v4();
        Uuid before = u;
        auto r = unmarshal_text(in, u);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == UidError::InvalidFormat);
        REQUIRE(u == before);
    }
}

// ===== JSON =====

TEST_CASE("json marshal quotes the canonical form", "[encoding][json]") {
    auto u = Uuid::from_string("afe40693-8f63-4766-85f1-250a427f1db5").value();
    REQUIRE(marshal_json(u) == "\"afe40693-8f63-4766-85f1-250a427f1db5\"");
    REQUIRE(marshal_json(Uuid()) == "\"\"");
}

TEST_CASE("json roundtrip", "[encoding][json]") {
    for (const auto& [in, want] : ROUNDTRIPS) {
        Uuid u;
        REQUIRE(unmarshal_json("\"" + in + "\"", u).is_ok());
        REQUIRE(marshal_json(u) == "\"" + want + "\"");
    }
}

TEST_CASE("json null leaves the value untouched", "[encoding][json]") {
    auto u = Uuid::from_string("afe40693-8f63-4766-85f1-250a427f1db5").value();
    REQUIRE(unmarshal_json("null", u).is_ok());
    REQUIRE(u.to_string() == "afe40693-8f63-4766-85f1-250a427f1db5");
}

TEST_CASE("json decodes escapes inside the string", "[encoding][json]") {
    Uuid u;
    auto r = unmarshal_json(
        "\"afe40693\\u002d8f63-4766-85f1-250a427f1db5\"", u);
    REQUIRE(r.is_ok());
    REQUIRE(u.to_string() == "afe40693-8f63-4766-85f1-250a427f1db5");
}

TEST_CASE("json tolerates surrounding whitespace", "[encoding][json]") {
    Uuid u;
    REQUIRE(unmarshal_json(" \"afe40693-8f63-4766-85f1-250a427f1db5\"\n", u).is_ok());
    REQUIRE(u.to_string() == "afe40693-8f63-4766-85f1-250a427f1db5");
    REQUIRE(unmarshal_json(" null ", u).is_ok());
    REQUIRE(u.to_string() == "afe40693-8f63-4766-85f1-250a427f1db5");
}

TEST_CASE("json rejects non-string literals", "[encoding][json]") {
    for (const char* lit : {"42", "true", "{}", "[]", "\"unterminated",
                            "'afe40693-8f63-4766-85f1-250a427f1db5'",
                            "\"bad \\q escape\"", "NULL",
                            "[\"afe40693-8f63-4766-85f1-250a427f1db5\"]"}) {
        Uuid u;
        auto r = unmarshal_json(lit, u);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == UidError::InvalidFormat);
        REQUIRE(r.error().message.find("must be string or null") != std::string::npos);
    }
}

TEST_CASE("json rejects malformed uuids", "[encoding][json]") {
    for (const auto& in : MALFORMED) {
        Uuid u;
        auto r = unmarshal_json("\"" + in + "\"", u);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == UidError::InvalidFormat);
        REQUIRE(r.error().message == "invalid uuid: " + in);
    }
}

// ===== binary =====

TEST_CASE("binary payload is the canonical text", "[encoding]") {
    auto u = Uuid::from_string("afe40693-8f63-4766-85f1-250a427f1db5").value();
    auto data = marshal_binary(u);
    REQUIRE(data.size() == 36);
    REQUIRE(std::string(data.begin(), data.end()) == u.to_string());
    REQUIRE(marshal_binary(Uuid()).empty());
}

TEST_CASE("binary roundtrip", "[encoding]") {
    for (const auto& [in, want] : ROUNDTRIPS) {
        Uuid u;
        REQUIRE(unmarshal_binary(std::vector<uint8_t>(in.begin(), in.end()), u).is_ok());
        auto out = marshal_binary(u);
        REQUIRE(std::string(out.begin(), out.end()) == want);
    }
}

TEST_CASE("binary unmarshal rejects malformed input", "[encoding]") {
    for (const auto& in : MALFORMED) {
        Uuid u;
        auto r = unmarshal_binary(std::vector<uint8_t>(in.begin(), in.end()), u);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == UidError::InvalidFormat);
    }
}
