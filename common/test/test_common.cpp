/* File: test_common.cpp
Copyright (C) Basealt LLC,  2024
Author: Oleg Proskurin, <proskurinov@basealt.ru>

This program is free software; you can redistribute it and/or
modify it under the terms of the GNU Lesser General Public
License as published by the Free Software Foundation; either
version 3 of the License, or (at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
Lesser General Public License for more details.

You should have received a copy of the GNU Lesser General Public License
along with this program; if not, write to the Free Software Foundation,
Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.
*/

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "config.hpp"
#include "sqlite_db.hpp"
#include "utils.hpp"

#ifndef TEST_DIR
#define TEST_DIR "/tmp/"
#endif

using namespace pdfseal;

TEST_CASE("Config") {
  SECTION("defaults") {
    std::istringstream empty;
    auto conf = LoadConfig(empty);
    REQUIRE(conf.otp.max_age_minutes == 10);
    REQUIRE(conf.tsa.timeout_ms == 5000);
    REQUIRE(conf.trust.allow_self_signed_fallback);
    REQUIRE(conf.signing.default_rect.llx == 425);
    REQUIRE(conf.signing.default_rect.ury == 150);
    REQUIRE(conf.tsa.serial_db == conf.storage.database);
  }
  SECTION("sections") {
    std::istringstream src(
      "[trust]\n"
      "org_pkcs12 = /etc/pdfseal/org.p12\n"
      "org_passphrase = secret\n"
      "allow_self_signed_fallback = false\n"
      "[tsa]\n"
      "policy_oid = 1.3.6.1.4.1.99999.1\n"
      "timeout_ms = 250\n"
      "[signing]\n"
      "default_rect = 125 20 275 70\n"
      "utc_offset_minutes = 120\n"
      "[storage]\n"
      "database = /var/lib/pdfseal/db.sqlite\n");
    auto conf = LoadConfig(src);
    REQUIRE(conf.trust.org_pkcs12 == "/etc/pdfseal/org.p12");
    REQUIRE(conf.trust.org_passphrase == "secret");
    REQUIRE_FALSE(conf.trust.allow_self_signed_fallback);
    REQUIRE(conf.tsa.policy_oid == "1.3.6.1.4.1.99999.1");
    REQUIRE(conf.tsa.timeout_ms == 250);
    REQUIRE(conf.signing.default_rect.llx == 125);
    REQUIRE(conf.signing.default_rect.urx == 275);
    REQUIRE(conf.signing.utc_offset_minutes == 120);
    REQUIRE(conf.tsa.serial_db == "/var/lib/pdfseal/db.sqlite");
  }
  SECTION("passphrase_from_env") {
    setenv("PDFSEAL_TEST_PASS", "from-env", 1);  // NOLINT
    std::istringstream src(
      "[trust]\ntsa_passphrase = env:PDFSEAL_TEST_PASS\n");
    auto conf = LoadConfig(src);
    REQUIRE(conf.trust.tsa_passphrase == "from-env");
    std::istringstream src_missing(
      "[trust]\ntsa_passphrase = env:PDFSEAL_TEST_NOT_SET_VAR\n");
    REQUIRE_THROWS_AS(LoadConfig(src_missing), std::invalid_argument);
  }
  SECTION("invalid") {
    std::istringstream bad_rect("[signing]\ndefault_rect = 1 2 3\n");
    REQUIRE_THROWS_AS(LoadConfig(bad_rect), std::invalid_argument);
    std::istringstream bad_timeout("[tsa]\ntimeout_ms = 0\n");
    REQUIRE_THROWS_AS(LoadConfig(bad_timeout), std::invalid_argument);
    std::istringstream unknown("[tsa]\nurl = http://example.com\n");
    REQUIRE_THROWS_AS(LoadConfig(unknown), std::invalid_argument);
    REQUIRE_THROWS_AS(LoadConfig(std::string("/no/such/file.ini")),
                      std::invalid_argument);
  }
}

TEST_CASE("Date formats") {
  // 2024-10-15 12:30:37 UTC
  const TimePoint time_point = std::chrono::system_clock::from_time_t(1728995437);
  REQUIRE(PdfDateString(time_point, 0) == "D:20241015123037Z");
  REQUIRE(PdfDateString(time_point, 120) == "D:20241015143037+02'00'");
  REQUIRE(PdfDateString(time_point, -210) == "D:20241015090037-03'30'");
  REQUIRE(StampDateString(time_point, 120) == "15/10/2024 14:30:37 +02:00");
  REQUIRE(TimePointToIso8601(time_point) == "2024-10-15T12:30:37.000Z");
  REQUIRE(TimeTToString(1728995437) == "2024-10-15 12:30:37 UTC");
  REQUIRE(MicrosToTimePoint(TimePointToMicros(time_point)) == time_point);
}

TEST_CASE("Slugify") {
  REQUIRE(Slugify("Jean Dupont") == "jean-dupont");
  REQUIRE(Slugify("  Anne--Marie  ") == "anne-marie");
  REQUIRE(Slugify("Zoé Ünal") == "zo-nal");
  REQUIRE(VecBytesStringRepresentation({0x00, 0xab, 0x10}) == "00ab10");
}

TEST_CASE("Sqlite") {
  using namespace pdfseal::storage;
  const std::string db_path = std::string(TEST_DIR) + "common_test.sqlite";
  std::filesystem::remove(db_path);
  SqliteDb db(db_path);
  db.Exec("CREATE TABLE item (id INTEGER PRIMARY KEY, name TEXT NOT NULL, "
          "payload BLOB, note TEXT)");

  SECTION("insert_select") {
    auto stmt =
      db.Prepare("INSERT INTO item(name, payload, note) VALUES(?, ?, ?)");
    stmt.Bind(1, std::string("first"))
      .Bind(2, BytesVector{1, 2, 3})
      .Bind(3, std::optional<std::string>());
    stmt.Exec();
    REQUIRE(db.LastInsertId() == 1);
    auto select = db.Prepare("SELECT name, payload, note FROM item");
    REQUIRE(select.Step());
    REQUIRE(select.GetText(0) == "first");
    REQUIRE(select.GetBlob(1) == BytesVector{1, 2, 3});
    REQUIRE_FALSE(select.GetOptionalText(2).has_value());
    REQUIRE_FALSE(select.Step());
  }
  SECTION("rollback_on_scope_exit") {
    {
      Transaction txn(db);
      db.Exec("INSERT INTO item(name) VALUES('lost')");
    }
    auto count = db.Prepare("SELECT COUNT(*) FROM item");
    REQUIRE(count.Step());
    REQUIRE(count.GetInt64(0) == 0);
  }
  SECTION("commit") {
    {
      Transaction txn(db);
      db.Exec("INSERT INTO item(name) VALUES('kept')");
      txn.Commit();
    }
    auto count = db.Prepare("SELECT COUNT(*) FROM item");
    REQUIRE(count.Step());
    REQUIRE(count.GetInt64(0) == 1);
  }
  SECTION("errors") {
    REQUIRE_THROWS_AS(db.Prepare("SELECT * FROM no_such_table"), StorageError);
    auto stmt = db.Prepare("INSERT INTO item(name) VALUES(NULL)");
    REQUIRE_THROWS_AS(stmt.Exec(), StorageError);
  }
}
