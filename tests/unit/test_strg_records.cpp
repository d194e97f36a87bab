/**
 * @file test_strg_records.cpp
 * @brief Tests for STRG language entries, name tables and string tables
 */

#include <catch2/catch_test_macros.hpp>
#include "RetroPak/strg/strg_records.hpp"
#include "helpers/test_archives.hpp"

using namespace RetroPak;
using namespace RetroPak::strg;
using core::FourCC;

// =============================================================================
// Fixed-size entries
// =============================================================================

TEST_CASE("LanguageEntry - decode and encode", "[strg][records]") {
  ByteBuffer bytes;
  test::putTag(bytes, "FREN");
  test::putU32(bytes, 16);
  test::putU32(bytes, 30);

  auto decoded = LanguageEntry::decode(bytes);
  REQUIRE(decoded.isOk());
  REQUIRE(decoded.value().consumed == LanguageEntry::PACKED_SIZE);

  const LanguageEntry& entry = decoded.value().value;
  REQUIRE(entry.languageId == FourCC("FREN"));
  REQUIRE(entry.stringsOffset == 16);
  REQUIRE(entry.stringsSize == 30);
  REQUIRE(entry.encode() == bytes);

  SECTION("Short input is a malformed header") {
    auto shortResult = LanguageEntry::decode(ByteSpan(bytes).first(11));
    REQUIRE(shortResult.isError());
    REQUIRE(shortResult.errorCode() == ErrorCode::MalformedHeader);
  }
}

TEST_CASE("NameEntry - decode and encode", "[strg][records]") {
  ByteBuffer bytes;
  test::putU32(bytes, 8);
  test::putU32(bytes, 3);

  auto decoded = NameEntry::decode(bytes);
  REQUIRE(decoded.isOk());
  REQUIRE(decoded.value().value == NameEntry{8, 3});
  REQUIRE(decoded.value().value.encode() == bytes);

  auto shortResult = NameEntry::decode(ByteSpan(bytes).first(4));
  REQUIRE(shortResult.isError());
  REQUIRE(shortResult.errorCode() == ErrorCode::MalformedHeader);
}

// =============================================================================
// NameTable
// =============================================================================

namespace {

// count=2, size=27: entries (16 -> 1), (22 -> 0), names "start", "quit"
ByteBuffer twoNameTable() {
  ByteBuffer out;
  test::putU32(out, 2);
  test::putU32(out, 27);
  test::putU32(out, 16);
  test::putU32(out, 1);
  test::putU32(out, 22);
  test::putU32(out, 0);
  test::putAscii(out, "start", true);
  test::putAscii(out, "quit", true);
  return out;
}

} // namespace

TEST_CASE("NameTable - decode", "[strg][names]") {
  const ByteBuffer bytes = twoNameTable();

  SECTION("Names resolve from offsets relative to the table body") {
    auto decoded = NameTable::decode(bytes);
    REQUIRE(decoded.isOk());
    REQUIRE(decoded.value().consumed == 35);

    const NameTable& table = decoded.value().value;
    REQUIRE(table.count() == 2);
    REQUIRE(table.names()[0] == "start");
    REQUIRE(table.names()[1] == "quit");
    REQUIRE(table.bodySize() == 27);
    REQUIRE(table.stringIndexFor("start").value() == 1);
    REQUIRE(table.stringIndexFor("quit").value() == 0);
  }

  SECTION("Trailing bytes are not consumed") {
    ByteBuffer longer = bytes;
    longer.push_back(0xAA);
    longer.push_back(0xBB);
    auto decoded = NameTable::decode(longer);
    REQUIRE(decoded.isOk());
    REQUIRE(decoded.value().consumed == 35);
  }

  SECTION("Encoding reproduces the input") {
    auto decoded = NameTable::decode(bytes);
    REQUIRE(decoded.isOk());
    REQUIRE(decoded.value().value.encode() == bytes);
    REQUIRE(decoded.value().value.encodedSize() == bytes.size());
  }

  SECTION("Unknown names are reported") {
    auto decoded = NameTable::decode(bytes);
    REQUIRE(decoded.isOk());
    auto missing = decoded.value().value.stringIndexFor("options");
    REQUIRE(missing.isError());
    REQUIRE(missing.errorCode() == ErrorCode::UnknownIdentifier);
  }
}

TEST_CASE("NameTable - corrupted input", "[strg][names][security]") {
  SECTION("Header shorter than 8 bytes") {
    const ByteBuffer bytes = {0, 0, 0, 1};
    auto decoded = NameTable::decode(bytes);
    REQUIRE(decoded.isError());
    REQUIRE(decoded.errorCode() == ErrorCode::MalformedHeader);
  }

  SECTION("Declared size larger than the input") {
    ByteBuffer bytes = twoNameTable();
    bytes.resize(bytes.size() - 3);
    auto decoded = NameTable::decode(bytes);
    REQUIRE(decoded.isError());
    REQUIRE(decoded.errorCode() == ErrorCode::TruncatedPayload);
  }

  SECTION("Entries do not fit in the declared size") {
    ByteBuffer bytes;
    test::putU32(bytes, 3);
    test::putU32(bytes, 8);
    test::putU32(bytes, 0);
    test::putU32(bytes, 0);
    auto decoded = NameTable::decode(bytes);
    REQUIRE(decoded.isError());
    REQUIRE(decoded.errorCode() == ErrorCode::MalformedHeader);
  }

  SECTION("Name without terminator") {
    ByteBuffer bytes;
    test::putU32(bytes, 1);
    test::putU32(bytes, 12);
    test::putU32(bytes, 8);
    test::putU32(bytes, 0);
    test::putAscii(bytes, "menu", false);
    auto decoded = NameTable::decode(bytes);
    REQUIRE(decoded.isError());
    REQUIRE(decoded.errorCode() == ErrorCode::MissingTerminator);
  }

  SECTION("Name offset outside the table") {
    ByteBuffer bytes;
    test::putU32(bytes, 1);
    test::putU32(bytes, 10);
    test::putU32(bytes, 40);
    test::putU32(bytes, 0);
    test::putAscii(bytes, "a", true);
    auto decoded = NameTable::decode(bytes);
    REQUIRE(decoded.isError());
    REQUIRE(decoded.errorCode() == ErrorCode::TruncatedPayload);
  }

  SECTION("Name count above the configured limit") {
    core::CodecConfig config;
    config.maxNameCount = 1;
    auto decoded = NameTable::decode(twoNameTable(), config);
    REQUIRE(decoded.isError());
    REQUIRE(decoded.errorCode() == ErrorCode::MalformedHeader);
  }
}

TEST_CASE("NameTable - layouts beyond the contiguous one", "[strg][names]") {
  SECTION("Unused declared bytes are kept") {
    ByteBuffer bytes;
    test::putU32(bytes, 1);
    test::putU32(bytes, 16);
    test::putU32(bytes, 8);
    test::putU32(bytes, 0);
    test::putAscii(bytes, "menu", true);
    bytes.insert(bytes.end(), 3, u8{0});

    auto decoded = NameTable::decode(bytes);
    REQUIRE(decoded.isOk());
    REQUIRE(decoded.value().value.bodySize() == 16);
    REQUIRE(decoded.value().value.encode() == bytes);
  }

  SECTION("Overlapping names are rejected") {
    ByteBuffer bytes;
    test::putU32(bytes, 2);
    test::putU32(bytes, 19);
    test::putU32(bytes, 16);
    test::putU32(bytes, 0);
    test::putU32(bytes, 17);
    test::putU32(bytes, 1);
    test::putAscii(bytes, "ab", true);

    auto decoded = NameTable::decode(bytes);
    REQUIRE(decoded.isError());
    REQUIRE(decoded.errorCode() == ErrorCode::MalformedHeader);
  }

  SECTION("Identical names may share an offset") {
    auto table = NameTable::create({NameEntry{16, 0}, NameEntry{16, 1}}, {"go", "go"});
    REQUIRE(table.isOk());
    REQUIRE(table.value().bodySize() == 19);

    auto decoded = NameTable::decode(table.value().encode());
    REQUIRE(decoded.isOk());
    REQUIRE(decoded.value().value == table.value());
  }
}

TEST_CASE("NameTable - create validates its parts", "[strg][names]") {
  SECTION("Entries and names must pair up") {
    auto table = NameTable::create({NameEntry{8, 0}}, {});
    REQUIRE(table.isError());
    REQUIRE(table.errorCode() == ErrorCode::StringCountMismatch);
  }

  SECTION("Names cannot start among the entries") {
    auto table = NameTable::create({NameEntry{4, 0}}, {"a"});
    REQUIRE(table.isError());
    REQUIRE(table.errorCode() == ErrorCode::MalformedHeader);
  }

  SECTION("Different names cannot share an offset") {
    auto table = NameTable::create({NameEntry{16, 0}, NameEntry{16, 1}}, {"go", "no"});
    REQUIRE(table.isError());
    REQUIRE(table.errorCode() == ErrorCode::MalformedHeader);
  }
}

TEST_CASE("NameTable - build", "[strg][names]") {
  const NameTable table = NameTable::build({{"start", 1}, {"quit", 0}});
  REQUIRE(table.entries()[0] == NameEntry{16, 1});
  REQUIRE(table.entries()[1] == NameEntry{22, 0});
  REQUIRE(table.bodySize() == 27);
  REQUIRE(table.encode() == twoNameTable());

  const NameTable empty = NameTable::build({});
  REQUIRE(empty.encodedSize() == NameTable::HEADER_SIZE);
  REQUIRE(empty.encode() == ByteBuffer(8, 0));
}

// =============================================================================
// StringTable
// =============================================================================

TEST_CASE("StringTable - decode", "[strg][strings]") {
  ByteBuffer bytes;
  test::putU32(bytes, 8);
  test::putU32(bytes, 16);
  test::putUtf16(bytes, u"Yes");
  test::putUtf16(bytes, u"No");

  SECTION("Strings are read up to the double-null terminator") {
    auto decoded = StringTable::decode(bytes, 2);
    REQUIRE(decoded.isOk());
    const StringTable& table = decoded.value();
    REQUIRE(table.count() == 2);
    REQUIRE(table.stringAt(0).value() == u"Yes");
    REQUIRE(table.stringAt(1).value() == u"No");
    REQUIRE(table.encodedSize() == bytes.size());
    REQUIRE(table.encode() == bytes);
  }

  SECTION("Zero high bytes inside a code unit are not terminators") {
    ByteBuffer text;
    test::putU32(text, 4);
    test::putUtf16(text, u"A\u0100B");
    auto decoded = StringTable::decode(text, 1);
    REQUIRE(decoded.isOk());
    REQUIRE(decoded.value().stringAt(0).value() == u"A\u0100B");
  }

  SECTION("Offsets that do not fit") {
    auto decoded = StringTable::decode(ByteSpan(bytes).first(6), 2);
    REQUIRE(decoded.isError());
    REQUIRE(decoded.errorCode() == ErrorCode::TruncatedPayload);
  }

  SECTION("Offset past the end") {
    ByteBuffer bad;
    test::putU32(bad, 64);
    test::putUtf16(bad, u"x");
    auto decoded = StringTable::decode(bad, 1);
    REQUIRE(decoded.isError());
    REQUIRE(decoded.errorCode() == ErrorCode::TruncatedPayload);
  }

  SECTION("Missing terminator") {
    ByteBuffer bad;
    test::putU32(bad, 4);
    test::putU16(bad, u'H');
    test::putU16(bad, u'i');
    auto decoded = StringTable::decode(bad, 1);
    REQUIRE(decoded.isError());
    REQUIRE(decoded.errorCode() == ErrorCode::MissingTerminator);
  }

  SECTION("Index out of range") {
    auto decoded = StringTable::decode(bytes, 2);
    REQUIRE(decoded.isOk());
    auto missing = decoded.value().stringAt(2);
    REQUIRE(missing.isError());
    REQUIRE(missing.errorCode() == ErrorCode::IndexOutOfRange);
  }
}

TEST_CASE("StringTable - build and replace", "[strg][strings]") {
  const StringTable table = StringTable::build({u"One", u"Two", u"Three"});
  REQUIRE(table.offsets() == std::vector<u32>{12, 20, 28});
  REQUIRE(table.encodedSize() == 40);

  SECTION("Growing a string moves every later offset") {
    auto replaced = table.withStringReplaced(0, u"Eleven");
    REQUIRE(replaced.isOk());
    REQUIRE(replaced.value().offsets() == std::vector<u32>{12, 26, 34});
    REQUIRE(replaced.value().stringAt(0).value() == u"Eleven");
    REQUIRE(replaced.value().encodedSize() == 46);
  }

  SECTION("Shrinking the middle string leaves earlier offsets alone") {
    auto replaced = table.withStringReplaced(1, u"2");
    REQUIRE(replaced.isOk());
    REQUIRE(replaced.value().offsets() == std::vector<u32>{12, 20, 24});
    REQUIRE(replaced.value().stringAt(2).value() == u"Three");
  }

  SECTION("Replacing the last string moves nothing") {
    auto replaced = table.withStringReplaced(2, u"");
    REQUIRE(replaced.isOk());
    REQUIRE(replaced.value().offsets() == table.offsets());
    REQUIRE(replaced.value().encodedSize() == 30);
  }

  SECTION("Replaced tables decode back to themselves") {
    auto replaced = table.withStringReplaced(1, u"Twenty-two");
    REQUIRE(replaced.isOk());
    const ByteBuffer bytes = replaced.value().encode();
    auto decoded = StringTable::decode(bytes, 3);
    REQUIRE(decoded.isOk());
    REQUIRE(decoded.value() == replaced.value());
  }

  SECTION("Out of range index") {
    auto replaced = table.withStringReplaced(3, u"Four");
    REQUIRE(replaced.isError());
    REQUIRE(replaced.errorCode() == ErrorCode::IndexOutOfRange);
  }
}

TEST_CASE("StringTable - offsets out of index order", "[strg][strings]") {
  // Index 1 is stored first: "No!" at 8, then "Yes" at 16
  ByteBuffer bytes;
  test::putU32(bytes, 16);
  test::putU32(bytes, 8);
  test::putUtf16(bytes, u"No!");
  test::putUtf16(bytes, u"Yes");
  REQUIRE(bytes.size() == 24);

  auto decoded = StringTable::decode(bytes, 2);
  REQUIRE(decoded.isOk());
  const StringTable& table = decoded.value();
  REQUIRE(table.stringAt(0).value() == u"Yes");
  REQUIRE(table.stringAt(1).value() == u"No!");

  SECTION("Encoding writes strings in offset order") {
    REQUIRE(table.encodedSize() == 24);
    REQUIRE(table.encode() == bytes);
  }

  SECTION("Growing the first stored string moves the other one") {
    auto replaced = table.withStringReplaced(1, u"Nope!");
    REQUIRE(replaced.isOk());
    REQUIRE(replaced.value().offsets() == std::vector<u32>{20, 8});
    REQUIRE(replaced.value().encodedSize() == 28);

    auto again = StringTable::decode(replaced.value().encode(), 2);
    REQUIRE(again.isOk());
    REQUIRE(again.value().stringAt(0).value() == u"Yes");
    REQUIRE(again.value().stringAt(1).value() == u"Nope!");
  }

  SECTION("Growing the last stored string moves nothing") {
    auto replaced = table.withStringReplaced(0, u"Yeah!");
    REQUIRE(replaced.isOk());
    REQUIRE(replaced.value().offsets() == std::vector<u32>{16, 8});

    auto again = StringTable::decode(replaced.value().encode(), 2);
    REQUIRE(again.isOk());
    REQUIRE(again.value().stringAt(0).value() == u"Yeah!");
    REQUIRE(again.value().stringAt(1).value() == u"No!");
  }
}

TEST_CASE("StringTable - gaps and shared strings", "[strg][strings]") {
  SECTION("Zero bytes between strings are kept") {
    ByteBuffer bytes;
    test::putU32(bytes, 8);
    test::putU32(bytes, 0);
    test::putUtf16(bytes, u"A");
    REQUIRE(bytes.size() == 12);

    auto decoded = StringTable::decode(bytes, 1);
    REQUIRE(decoded.isOk());
    REQUIRE(decoded.value().encodedSize() == 12);
    REQUIRE(decoded.value().encode() == bytes);
  }

  SECTION("Indices sharing an offset share one string") {
    ByteBuffer bytes;
    test::putU32(bytes, 8);
    test::putU32(bytes, 8);
    test::putUtf16(bytes, u"Hi");

    auto decoded = StringTable::decode(bytes, 2);
    REQUIRE(decoded.isOk());
    REQUIRE(decoded.value().stringAt(1).value() == u"Hi");
    REQUIRE(decoded.value().encode() == bytes);

    auto replaced = decoded.value().withStringReplaced(0, u"Hey");
    REQUIRE(replaced.isOk());
    REQUIRE(replaced.value().offsets() == std::vector<u32>{8, 8});
    REQUIRE(replaced.value().stringAt(1).value() == u"Hey");
    REQUIRE(replaced.value().encodedSize() == 16);
  }
}

TEST_CASE("StringTable - create validates its parts", "[strg][strings]") {
  SECTION("Offsets and strings must pair up") {
    auto table = StringTable::create({4}, {u"a", u"b"});
    REQUIRE(table.isError());
    REQUIRE(table.errorCode() == ErrorCode::StringCountMismatch);
  }

  SECTION("Strings cannot start inside the offset array") {
    auto table = StringTable::create({0}, {u"a"});
    REQUIRE(table.isError());
    REQUIRE(table.errorCode() == ErrorCode::MalformedHeader);
  }

  SECTION("Strings cannot overlap") {
    auto table = StringTable::create({8, 10}, {u"abc", u"x"});
    REQUIRE(table.isError());
    REQUIRE(table.errorCode() == ErrorCode::MalformedHeader);
  }

  SECTION("Different strings cannot share an offset") {
    auto table = StringTable::create({8, 8}, {u"a", u"b"});
    REQUIRE(table.isError());
    REQUIRE(table.errorCode() == ErrorCode::MalformedHeader);
  }

  SECTION("A valid layout is accepted") {
    auto table = StringTable::create({8, 12}, {u"a", u"b"});
    REQUIRE(table.isOk());
    REQUIRE(table.value() == StringTable::build({u"a", u"b"}));
    REQUIRE(table.value().encodedSize() == 16);
  }
}
