#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "common/bytes.hpp"
#include "common/test_check.hpp"
#include "pngstash/codec/record.hpp"

using namespace pngstash::codec;

/*
================================================================================
Record: Unit Tests
================================================================================

Covers:
  • Construction (length + CRC-32 derived from type and data)
  • Decoding the reference chunk and its accessors
  • Fail-fast decoding order: length, type, data, checksum, integrity
  • Single-bit corruption detection in data and checksum
  • Serialization as the exact inverse of parsing
  • UTF-8 text extraction
================================================================================
*/

static TypeCode type_of(const std::string& s) {
    TypeCode t;
    TEST_CHECK(TypeCode::from_string(s, t) == type_code::Status::Ok);
    return t;
}

static std::vector<std::uint8_t> bytes_of(std::string_view s) {
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

static record::Error parse(const std::vector<std::uint8_t>& buffer, Record& out, std::size_t& consumed) {
    return Record::parse(buffer, out, consumed);
}

// ------------------------------------------------------------
// Construction
// ------------------------------------------------------------

void test_new_record() {
    std::cout << "[TEST] Record construction..." << std::endl;

    Record r(type_of("RuSt"), bytes_of(test_bytes::SECRET_MESSAGE));
    TEST_CHECK_EQ(r.length(), 42u);
    TEST_CHECK_EQ(r.checksum(), test_bytes::SECRET_CRC);
    TEST_CHECK(r.type() == type_of("RuSt"));
    TEST_CHECK_EQ(r.data().size(), 42u);
    TEST_CHECK_EQ(r.byte_size(), 54u);

    std::cout << "[TEST] OK\n";
}

void test_empty_record() {
    std::cout << "[TEST] Record with empty data..." << std::endl;

    // IEND carries no data, its CRC is fixed by the PNG standard
    Record r(type_of("IEND"), {});
    TEST_CHECK_EQ(r.length(), 0u);
    TEST_CHECK_EQ(r.checksum(), 0xAE426082u);

    std::string text = "stale";
    TEST_CHECK(r.as_text(text).ok());
    TEST_CHECK(text.empty());

    std::cout << "[TEST] OK\n";
}

// ------------------------------------------------------------
// Decoding
// ------------------------------------------------------------

void test_parse_reference_record() {
    std::cout << "[TEST] Record parse (reference chunk)..." << std::endl;

    Record r;
    std::size_t consumed = 0;
    auto err = parse(test_bytes::secret_record(), r, consumed);
    TEST_CHECK(err.ok());

    TEST_CHECK_EQ(r.length(), 42u);
    TEST_CHECK_EQ(r.type().to_string(), std::string("RuSt"));
    TEST_CHECK_EQ(r.checksum(), test_bytes::SECRET_CRC);
    TEST_CHECK_EQ(consumed, FRAMING_SIZE + 42);

    std::string text;
    TEST_CHECK(r.as_text(text).ok());
    TEST_CHECK_EQ(text, std::string(test_bytes::SECRET_MESSAGE));

    std::cout << "[TEST] OK\n";
}

void test_parse_ignores_trailing_bytes() {
    std::cout << "[TEST] Record parse (trailing bytes)..." << std::endl;

    auto buffer = test_bytes::secret_record();
    buffer.push_back(0xAA);
    buffer.push_back(0xBB);

    Record r;
    std::size_t consumed = 0;
    TEST_CHECK(parse(buffer, r, consumed).ok());
    TEST_CHECK_EQ(consumed, buffer.size() - 2);

    std::cout << "[TEST] OK\n";
}

void test_parse_wrong_crc() {
    std::cout << "[TEST] Record parse (wrong CRC)..." << std::endl;

    auto buffer = test_bytes::raw_record(42, "RuSt", test_bytes::SECRET_MESSAGE, 2882656333u);

    Record r(type_of("keEp"), bytes_of("untouched"));
    const Record before = r;
    std::size_t consumed = 7;
    auto err = parse(buffer, r, consumed);
    TEST_CHECK(err.code == record::Status::MismatchCrc);
    TEST_CHECK_EQ(err.stored_crc, 2882656333u);
    TEST_CHECK_EQ(err.computed_crc, test_bytes::SECRET_CRC);
    TEST_CHECK_EQ(err.offset, HEADER_SIZE + 42);
    // Nothing is constructed on failure
    TEST_CHECK(r == before);
    TEST_CHECK_EQ(consumed, 7u);

    std::cout << "[TEST] OK\n";
}

void test_parse_truncated_length() {
    std::cout << "[TEST] Record parse (truncated length)..." << std::endl;

    Record r;
    std::size_t consumed = 0;
    TEST_CHECK(parse({}, r, consumed).code == record::Status::InvalidLength);
    TEST_CHECK(parse({0x00, 0x00, 0x00}, r, consumed).code == record::Status::InvalidLength);

    std::cout << "[TEST] OK\n";
}

void test_parse_truncated_type() {
    std::cout << "[TEST] Record parse (truncated type)..." << std::endl;

    std::vector<std::uint8_t> buffer = {0x00, 0x00, 0x00, 0x00, 'R', 'u'};
    Record r;
    std::size_t consumed = 0;
    auto err = parse(buffer, r, consumed);
    TEST_CHECK(err.code == record::Status::InvalidChunkType);
    TEST_CHECK(err.type_cause == type_code::Status::InvalidLength);

    std::cout << "[TEST] OK\n";
}

void test_parse_malformed_type() {
    std::cout << "[TEST] Record parse (malformed type)..." << std::endl;

    auto buffer = test_bytes::raw_record(2, "Ru1t", "hi", 0);
    Record r;
    std::size_t consumed = 0;
    auto err = parse(buffer, r, consumed);
    TEST_CHECK(err.code == record::Status::InvalidChunkType);
    TEST_CHECK(err.type_cause == type_code::Status::InvalidFormat);
    TEST_CHECK_EQ(err.offset, LENGTH_SIZE);

    std::cout << "[TEST] OK\n";
}

void test_parse_truncated_data() {
    std::cout << "[TEST] Record parse (truncated data)..." << std::endl;

    // Declares 42 bytes but the buffer stops inside the message
    auto full = test_bytes::secret_record();
    std::vector<std::uint8_t> buffer(full.begin(), full.begin() + HEADER_SIZE + 10);

    Record r;
    std::size_t consumed = 0;
    TEST_CHECK(parse(buffer, r, consumed).code == record::Status::InvalidLength);

    // A huge declared length must not be trusted
    auto huge = test_bytes::raw_record(0xFFFFFFFFu, "RuSt", "", 0);
    TEST_CHECK(parse(huge, r, consumed).code == record::Status::InvalidLength);

    std::cout << "[TEST] OK\n";
}

void test_parse_truncated_crc() {
    std::cout << "[TEST] Record parse (truncated CRC)..." << std::endl;

    auto full = test_bytes::secret_record();
    for (std::size_t cut = 1; cut <= CRC_SIZE; ++cut) {
        std::vector<std::uint8_t> buffer(full.begin(), full.end() - static_cast<std::ptrdiff_t>(cut));
        Record r;
        std::size_t consumed = 0;
        TEST_CHECK(parse(buffer, r, consumed).code == record::Status::InvalidCrc);
    }

    std::cout << "[TEST] OK\n";
}

void test_single_bit_corruption() {
    std::cout << "[TEST] Record parse (single bit flips)..." << std::endl;

    const auto clean = test_bytes::secret_record();
    // data region and checksum region
    for (std::size_t i = HEADER_SIZE; i < clean.size(); ++i) {
        for (int bit = 0; bit < 8; ++bit) {
            auto buffer = clean;
            buffer[i] ^= static_cast<std::uint8_t>(1u << bit);
            Record r;
            std::size_t consumed = 0;
            TEST_CHECK(parse(buffer, r, consumed).code == record::Status::MismatchCrc);
        }
    }

    std::cout << "[TEST] OK\n";
}

// ------------------------------------------------------------
// Serialization
// ------------------------------------------------------------

void test_serialize_layout() {
    std::cout << "[TEST] Record serialize (layout)..." << std::endl;

    Record r(type_of("RuSt"), bytes_of(test_bytes::SECRET_MESSAGE));
    TEST_CHECK(r.serialize() == test_bytes::secret_record());

    std::vector<std::uint8_t> out = {0x01, 0x02};
    r.serialize_into(out);
    TEST_CHECK_EQ(out.size(), 2 + r.byte_size());
    TEST_CHECK(out[0] == 0x01 && out[1] == 0x02);
    TEST_CHECK(std::vector<std::uint8_t>(out.begin() + 2, out.end()) == test_bytes::secret_record());

    std::cout << "[TEST] OK\n";
}

void test_round_trip() {
    std::cout << "[TEST] Record round trip..." << std::endl;

    const std::vector<std::vector<std::uint8_t>> payloads = {
        {},
        {0x00},
        bytes_of("hello"),
        std::vector<std::uint8_t>(1000, 0xFF),
    };

    for (const auto& payload : payloads) {
        Record original(type_of("ruSt"), payload);
        Record decoded;
        std::size_t consumed = 0;
        TEST_CHECK(parse(original.serialize(), decoded, consumed).ok());
        TEST_CHECK(decoded == original);
        TEST_CHECK_EQ(consumed, original.byte_size());
    }

    std::cout << "[TEST] OK\n";
}

// ------------------------------------------------------------
// Text
// ------------------------------------------------------------

void test_as_text_invalid_utf8() {
    std::cout << "[TEST] Record text (invalid UTF-8)..." << std::endl;

    Record r(type_of("ruSt"), {0x66, 0x6F, 0xC3, 0x28});
    std::string text = "keep";
    auto err = r.as_text(text);
    TEST_CHECK(err.code == record::Status::TextConversion);
    TEST_CHECK_EQ(text, std::string("keep"));

    Record utf8(type_of("ruSt"), bytes_of("caf\xC3\xA9"));
    TEST_CHECK(utf8.as_text(text).ok());
    TEST_CHECK_EQ(text, std::string("caf\xC3\xA9"));

    std::cout << "[TEST] OK\n";
}

// ------------------------------------------------------------
// Diagnostics
// ------------------------------------------------------------

void test_display() {
    std::cout << "[TEST] Record display..." << std::endl;

    Record r(type_of("RuSt"), bytes_of(test_bytes::SECRET_MESSAGE));
    std::ostringstream oss;
    oss << r;
    const std::string s = oss.str();
    TEST_CHECK(s.find("Length: 42") != std::string::npos);
    TEST_CHECK(s.find("Type: RuSt") != std::string::npos);
    TEST_CHECK(s.find("Data: 42 bytes") != std::string::npos);
    TEST_CHECK(s.find("Crc: 2882656334") != std::string::npos);

    auto err = record::Error::from_type_code(type_code::Status::InvalidFormat, 4);
    TEST_CHECK(record::to_string(err).find("invalid chunk type") != std::string::npos);
    TEST_CHECK(record::to_string(err).find("ASCII letters") != std::string::npos);

    std::cout << "[TEST] OK\n";
}

// ------------------------------------------------------------
// MAIN
// ------------------------------------------------------------

int main() {
    test_new_record();
    test_empty_record();

    test_parse_reference_record();
    test_parse_ignores_trailing_bytes();
    test_parse_wrong_crc();
    test_parse_truncated_length();
    test_parse_truncated_type();
    test_parse_malformed_type();
    test_parse_truncated_data();
    test_parse_truncated_crc();
    test_single_bit_corruption();

    test_serialize_layout();
    test_round_trip();

    test_as_text_invalid_utf8();
    test_display();

    std::cout << "[TEST] ALL RECORD TESTS PASSED!\n";
    return 0;
}
