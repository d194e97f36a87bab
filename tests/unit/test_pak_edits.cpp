/**
 * @file test_pak_edits.cpp
 * @brief Tests for structural PAK edits: insert, append, remove and replace
 *
 * Every edit must leave offsets at the padded directory size plus the padded
 * sizes of all earlier payloads, so the edited archive encodes to exactly the
 * layout its directory describes.
 */

#include <catch2/catch_test_macros.hpp>
#include "RetroPak/pak/pak.hpp"
#include "RetroPak/strg/strg.hpp"
#include "helpers/test_archives.hpp"

using namespace RetroPak;
using namespace RetroPak::pak;
using core::FourCC;

namespace {

Pak appendAll(Pak archive, const std::vector<std::pair<u32, assets::ResourcePtr>>& items) {
  for (const auto& [assetId, resource] : items) {
    auto next = archive.withResourceAppended(assetId, resource);
    REQUIRE(next.isOk());
    archive = std::move(next).value();
  }
  return archive;
}

// TXTR 0x10 (32 bytes), CMDL 0x20 (64 bytes), TXTR 0x30 (32 bytes)
Pak threeResourcePak() {
  return appendAll(Pak::empty(), {{0x10, test::opaque("TXTR", 32, 1)},
                                  {0x20, test::opaque("CMDL", 64, 2)},
                                  {0x30, test::opaque("TXTR", 32, 3)}});
}

std::vector<u32> offsetsOf(const Pak& archive) {
  std::vector<u32> offsets;
  for (const auto& entry : archive.entries()) {
    offsets.push_back(entry.offset);
  }
  return offsets;
}

std::vector<u32> idsOf(const Pak& archive) {
  std::vector<u32> ids;
  for (const auto& entry : archive.entries()) {
    ids.push_back(entry.assetId);
  }
  return ids;
}

} // namespace

TEST_CASE("Pak edits - building by appending", "[pak][edit]") {
  const Pak archive = threeResourcePak();

  REQUIRE(archive.resourceCount() == 3);
  REQUIRE(archive.headerSize() == 76);
  REQUIRE(offsetsOf(archive) == std::vector<u32>{96, 128, 192});
  REQUIRE(test::offsetsAreLaidOut(archive));
  REQUIRE(archive.encodedSize() == 224);
  REQUIRE(archive.encode().size() == 224);
}

TEST_CASE("Pak edits - append", "[pak][edit]") {
  const Pak archive = threeResourcePak();

  auto appended = archive.withResourceAppended(0x40, test::opaque("TXTR", 32, 4));
  REQUIRE(appended.isOk());
  const Pak& result = appended.value();

  SECTION("The new payload follows the last one") {
    const ResourceEntry& last = archive.entries().back();
    REQUIRE(result.resourceCount() == 4);
    REQUIRE(result.entries()[3].offset == last.offset + last.size);
    REQUIRE(result.entries()[3].offset == 224);
    REQUIRE(result.entries()[3].assetType == FourCC("TXTR"));
    REQUIRE(result.entries()[3].size == 32);
    REQUIRE_FALSE(result.entries()[3].compressed());
  }

  SECTION("Earlier entries keep their offsets") {
    REQUIRE(offsetsOf(result) == std::vector<u32>{96, 128, 192, 224});
    REQUIRE(test::offsetsAreLaidOut(result));
  }

  SECTION("The source archive is unchanged") {
    REQUIRE(archive.resourceCount() == 3);
    REQUIRE_FALSE(archive.contains(0x40));
  }

  SECTION("The new asset is reachable by ID") {
    auto resource = result.lookup(0x40);
    REQUIRE(resource.isOk());
    REQUIRE(resource.value()->encode() == test::blob(32, 4));
    REQUIRE(result.indexOf(0x40).value() == 3);
  }
}

TEST_CASE("Pak edits - insert", "[pak][edit]") {
  const Pak archive = threeResourcePak();

  SECTION("Inserting in the middle shifts the tail by the padded size") {
    auto inserted = archive.withResourceInserted(1, 0x15, test::opaque("SCAN", 40, 9));
    REQUIRE(inserted.isOk());
    const Pak& result = inserted.value();

    REQUIRE(idsOf(result) == std::vector<u32>{0x10, 0x15, 0x20, 0x30});
    REQUIRE(offsetsOf(result) == std::vector<u32>{96, 128, 192, 256});
    REQUIRE(result.entries()[1].size == 40);
    REQUIRE(test::offsetsAreLaidOut(result));
    REQUIRE(result.indexOf(0x20).value() == 2);
  }

  SECTION("Inserting at the front") {
    auto inserted = archive.withResourceInserted(0, 0x05, test::opaque("TXTR", 1, 9));
    REQUIRE(inserted.isOk());
    REQUIRE(idsOf(inserted.value()) == std::vector<u32>{0x05, 0x10, 0x20, 0x30});
    REQUIRE(offsetsOf(inserted.value()) == std::vector<u32>{96, 128, 160, 224});
    REQUIRE(test::offsetsAreLaidOut(inserted.value()));
  }

  SECTION("Inserting at the end equals appending") {
    auto inserted = archive.withResourceInserted(3, 0x40, test::opaque("TXTR", 32, 4));
    auto appended = archive.withResourceAppended(0x40, test::opaque("TXTR", 32, 4));
    REQUIRE(inserted.isOk());
    REQUIRE(appended.isOk());
    REQUIRE(inserted.value() == appended.value());
  }

  SECTION("Insert then remove restores the archive") {
    auto inserted = archive.withResourceInserted(2, 0x99, test::opaque("HINT", 70, 6));
    REQUIRE(inserted.isOk());
    auto removed = inserted.value().withResourceRemoved(2);
    REQUIRE(removed.isOk());
    REQUIRE(removed.value() == archive);
  }

  SECTION("Rejected inserts") {
    auto outOfRange = archive.withResourceInserted(4, 0x50, test::opaque("TXTR", 32, 0));
    REQUIRE(outOfRange.isError());
    REQUIRE(outOfRange.errorCode() == ErrorCode::IndexOutOfRange);

    auto duplicate = archive.withResourceInserted(0, 0x20, test::opaque("TXTR", 32, 0));
    REQUIRE(duplicate.isError());
    REQUIRE(duplicate.errorCode() == ErrorCode::DuplicateIdentifier);

    auto null = archive.withResourceInserted(0, 0x50, nullptr);
    REQUIRE(null.isError());
    REQUIRE(null.errorCode() == ErrorCode::Unknown);
  }
}

TEST_CASE("Pak edits - directory growth across a padding boundary", "[pak][edit]") {
  // Four entries fill the directory to exactly 96 bytes; a fifth needs 128
  const Pak four = appendAll(threeResourcePak(), {{0x40, test::opaque("TXTR", 32, 4)}});
  REQUIRE(four.headerSize() == 96);
  REQUIRE(offsetsOf(four) == std::vector<u32>{96, 128, 192, 224});

  auto grown = four.withResourceInserted(2, 0x25, test::opaque("DUMB", 10, 7));
  REQUIRE(grown.isOk());
  const Pak& five = grown.value();

  REQUIRE(five.headerSize() == 116);
  REQUIRE(offsetsOf(five) == std::vector<u32>{128, 160, 224, 256, 288});
  REQUIRE(test::offsetsAreLaidOut(five));

  SECTION("Removing the fifth entry shrinks the directory again") {
    auto shrunk = five.withResourceRemovedById(0x25);
    REQUIRE(shrunk.isOk());
    REQUIRE(shrunk.value() == four);
  }

  SECTION("The grown archive encodes to its directory") {
    auto decoded = Pak::decode(five.encode());
    REQUIRE(decoded.isOk());
    REQUIRE(decoded.value() == five);
  }
}

TEST_CASE("Pak edits - remove", "[pak][edit]") {
  const Pak archive = threeResourcePak();

  SECTION("Removing the middle entry pulls the tail forward") {
    auto removed = archive.withResourceRemoved(1);
    REQUIRE(removed.isOk());
    REQUIRE(idsOf(removed.value()) == std::vector<u32>{0x10, 0x30});
    REQUIRE(offsetsOf(removed.value()) == std::vector<u32>{64, 96});
    REQUIRE(test::offsetsAreLaidOut(removed.value()));
    REQUIRE_FALSE(removed.value().contains(0x20));
    REQUIRE(removed.value().indexOf(0x30).value() == 1);
  }

  SECTION("Removing by ID") {
    auto removed = archive.withResourceRemovedById(0x30);
    REQUIRE(removed.isOk());
    REQUIRE(idsOf(removed.value()) == std::vector<u32>{0x10, 0x20});
    REQUIRE(test::offsetsAreLaidOut(removed.value()));
  }

  SECTION("Removing everything leaves an empty archive") {
    auto removed = archive.withResourceRemoved(0);
    REQUIRE(removed.isOk());
    removed = removed.value().withResourceRemoved(0);
    REQUIRE(removed.isOk());
    removed = removed.value().withResourceRemoved(0);
    REQUIRE(removed.isOk());
    REQUIRE(removed.value() == Pak::empty());
  }

  SECTION("Rejected removals") {
    auto outOfRange = archive.withResourceRemoved(3);
    REQUIRE(outOfRange.isError());
    REQUIRE(outOfRange.errorCode() == ErrorCode::IndexOutOfRange);

    auto unknown = archive.withResourceRemovedById(0x77);
    REQUIRE(unknown.isError());
    REQUIRE(unknown.errorCode() == ErrorCode::UnknownIdentifier);

    auto empty = Pak::empty().withResourceRemoved(0);
    REQUIRE(empty.isError());
    REQUIRE(empty.errorCode() == ErrorCode::IndexOutOfRange);
  }
}

TEST_CASE("Pak edits - replace", "[pak][edit]") {
  const Pak archive = threeResourcePak();

  SECTION("Replacing keeps the position and asset ID") {
    auto replaced = archive.withResourceReplacedById(0x20, test::opaque("CMDL", 100, 8));
    REQUIRE(replaced.isOk());
    const Pak& result = replaced.value();

    REQUIRE(idsOf(result) == std::vector<u32>{0x10, 0x20, 0x30});
    REQUIRE(result.entries()[1].size == 100);
    REQUIRE(offsetsOf(result) == std::vector<u32>{96, 128, 256});
    REQUIRE(test::offsetsAreLaidOut(result));
    REQUIRE(result.lookup(0x20).value()->encode() == test::blob(100, 8));
  }

  SECTION("Replacing the last entry") {
    auto replaced = archive.withResourceReplaced(2, test::opaque("TXTR", 5, 8));
    REQUIRE(replaced.isOk());
    REQUIRE(idsOf(replaced.value()) == std::vector<u32>{0x10, 0x20, 0x30});
    REQUIRE(replaced.value().entries()[2].size == 5);
    REQUIRE(test::offsetsAreLaidOut(replaced.value()));
  }

  SECTION("Rejected replacements") {
    auto outOfRange = archive.withResourceReplaced(3, test::opaque("TXTR", 5, 8));
    REQUIRE(outOfRange.isError());
    REQUIRE(outOfRange.errorCode() == ErrorCode::IndexOutOfRange);

    auto unknown = archive.withResourceReplacedById(0x77, test::opaque("TXTR", 5, 8));
    REQUIRE(unknown.isError());
    REQUIRE(unknown.errorCode() == ErrorCode::UnknownIdentifier);
  }
}

TEST_CASE("Pak edits - edited archives decode back to themselves", "[pak][edit]") {
  const Pak archive = threeResourcePak();

  auto edited = archive.withResourceInserted(1, 0x11, test::opaque("HINT", 33, 1));
  REQUIRE(edited.isOk());
  edited = edited.value().withResourceRemovedById(0x30);
  REQUIRE(edited.isOk());
  edited = edited.value().withResourceReplacedById(0x10, test::opaque("TXTR", 90, 4));
  REQUIRE(edited.isOk());

  const ByteBuffer bytes = edited.value().encode();
  REQUIRE(bytes.size() == edited.value().encodedSize());

  auto decoded = Pak::decode(bytes);
  REQUIRE(decoded.isOk());
  REQUIRE(decoded.value() == edited.value());
  REQUIRE(decoded.value().encode() == bytes);
}

TEST_CASE("Pak edits - editing a STRG inside an archive", "[pak][edit][strg]") {
  auto decoded = Pak::decode(test::minimalPakBytes());
  REQUIRE(decoded.isOk());
  const Pak& archive = decoded.value();

  auto table = archive.lookupAs<strg::Strg>(0x1);
  REQUIRE(table.isOk());

  auto edited = table.value()->withStringReplaced(FourCC("ENGL"), 0, u"Hello, world");
  REQUIRE(edited.isOk());
  REQUIRE(edited.value().encodedSize() == 128);

  auto replaced =
      archive.withResourceReplacedById(0x1, std::make_shared<strg::Strg>(edited.value()));
  REQUIRE(replaced.isOk());
  REQUIRE(replaced.value().entries()[0].size == 128);
  REQUIRE(replaced.value().entries()[0].offset == 64);
  REQUIRE(replaced.value().namedResources() == archive.namedResources());
  REQUIRE(replaced.value().encodedSize() == 192);

  auto reread = Pak::decode(replaced.value().encode());
  REQUIRE(reread.isOk());
  auto rereadTable = reread.value().lookupAs<strg::Strg>(0x1);
  REQUIRE(rereadTable.isOk());
  REQUIRE(rereadTable.value()->getString(FourCC("ENGL"), "title").value() == u"Hello, world");
  REQUIRE(rereadTable.value()->getString(FourCC("FREN"), "title").value() == u"Salut");
  REQUIRE(reread.value() == replaced.value());
}
