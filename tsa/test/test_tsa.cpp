/* File: test_tsa.cpp
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

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "cms_signer.hpp"
#include "hash_utils.hpp"
#include "internal_tsa.hpp"
#include "serial_allocator.hpp"
#include "signature_info.hpp"
#include "test_material.hpp"
#include "timestamp_client.hpp"
#include "tsa_errors.hpp"
#include "tst_info.hpp"

using namespace pdfseal;
using namespace pdfseal::tsa;

namespace {

class SlowAuthority : public ITimestampAuthority {
 public:
  BytesVector Respond(const BytesVector & /*request_der*/) override {
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    return {};
  }
};

class BrokenAuthority : public ITimestampAuthority {
 public:
  BytesVector Respond(const BytesVector & /*request_der*/) override {
    throw std::runtime_error("unreachable");
  }
};

// returns a valid response for some other request
class ReplayAuthority : public ITimestampAuthority {
 public:
  explicit ReplayAuthority(std::shared_ptr<ITimestampAuthority> inner)
    : inner_(std::move(inner)) {}

  BytesVector Respond(const BytesVector &request_der) override {
    if (recorded_.empty()) {
      recorded_ = inner_->Respond(request_der);
    }
    return recorded_;
  }

 private:
  std::shared_ptr<ITimestampAuthority> inner_;
  BytesVector recorded_;
};

struct TsaFixture {
  std::string dir = test::MakeTempDir("pdfseal_tsa");
  std::shared_ptr<const crypto::TrustMaterial> trust = test::MakeTestTrust();
  storage::SharedDb db =
    std::make_shared<storage::SqliteDb>(dir + "/serial.sqlite");
  std::shared_ptr<SerialAllocator> serials =
    std::make_shared<SerialAllocator>(db);
  std::shared_ptr<InternalTsa> tsa =
    std::make_shared<InternalTsa>(trust, serials, "1.2.3.4.1");

  TsaFixture() = default;
  TsaFixture(const TsaFixture &) = delete;
  TsaFixture &operator=(const TsaFixture &) = delete;
  TsaFixture(TsaFixture &&) = delete;
  TsaFixture &operator=(TsaFixture &&) = delete;
  ~TsaFixture() {
    db.reset();
    std::error_code err;
    std::filesystem::remove_all(dir, err);
  }
};

}  // namespace

TEST_CASE("SerialAllocator") {
  const std::string dir = test::MakeTempDir("pdfseal_serial");
  const std::string path = dir + "/serial.sqlite";
  uint64_t last = 0;
  {
    auto db = std::make_shared<storage::SqliteDb>(path);
    SerialAllocator alloc(db);
    const uint64_t first = alloc.Next();
    const uint64_t second = alloc.Next();
    REQUIRE(second > first);
    last = second;
  }
  SECTION("monotonic_after_restart") {
    auto db = std::make_shared<storage::SqliteDb>(path);
    SerialAllocator alloc(db);
    REQUIRE(alloc.Next() > last);
  }
  SECTION("unique_under_concurrency") {
    auto db = std::make_shared<storage::SqliteDb>(path);
    SerialAllocator alloc(db);
    std::mutex mutex;
    std::set<uint64_t> seen;
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
      threads.emplace_back([&]() {
        for (int j = 0; j < 20; ++j) {
          const uint64_t serial = alloc.Next();
          const std::lock_guard<std::mutex> lock(mutex);
          seen.insert(serial);
        }
      });
    }
    for (auto &thread : threads) {
      thread.join();
    }
    REQUIRE(seen.size() == 160);
    REQUIRE(*seen.begin() > last);
  }
  std::filesystem::remove_all(dir);
}

// every thread owns its connection, like separate server processes
TEST_CASE("Serials from independent connections") {
  const std::string dir = test::MakeTempDir("pdfseal_serial_procs");
  const std::string path = dir + "/serial.sqlite";
  const auto trust = test::MakeTestTrust();
  {
    // schema
    SerialAllocator init(std::make_shared<storage::SqliteDb>(path));
  }
  constexpr size_t kWorkers = 10;
  constexpr size_t kCalls = 100;
  std::vector<std::vector<uint64_t>> serials(kWorkers);
  std::atomic<int> errors{0};
  std::vector<std::thread> threads;
  for (size_t i = 0; i < kWorkers; ++i) {
    threads.emplace_back([&, i]() {
      try {
        auto db = std::make_shared<storage::SqliteDb>(path);
        auto authority = std::make_shared<InternalTsa>(
          trust, std::make_shared<SerialAllocator>(db), "1.2.3.4.1");
        const TimestampClient client(authority,
                                     std::chrono::milliseconds(30000));
        const BytesVector data{'w', static_cast<unsigned char>(i)};
        for (size_t j = 0; j < kCalls; ++j) {
          serials[i].push_back(
            ParseTimestampToken(client.Timestamp(data)).serial);
        }
      } catch (const std::exception &) {
        ++errors;
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }
  REQUIRE(errors == 0);
  std::set<uint64_t> all;
  for (const auto &sequence : serials) {
    REQUIRE(sequence.size() == kCalls);
    for (size_t j = 1; j < sequence.size(); ++j) {
      REQUIRE(sequence[j] > sequence[j - 1]);
    }
    all.insert(sequence.cbegin(), sequence.cend());
  }
  REQUIRE(all.size() == kWorkers * kCalls);
  REQUIRE(*all.begin() >= 1);
  std::filesystem::remove_all(dir);
}

TEST_CASE("InternalTsa") {
  const TsaFixture fixture;
  const BytesVector data{'h', 'e', 'l', 'l', 'o'};
  const TimestampClient client(fixture.tsa, std::chrono::milliseconds(5000));

  SECTION("token_content") {
    const auto before = std::chrono::system_clock::now();
    auto token = client.Timestamp(data);
    REQUIRE_FALSE(token.empty());
    auto info = ParseTimestampToken(token);
    REQUIRE(info.version == 1);
    REQUIRE(info.policy == "1.2.3.4.1");
    REQUIRE(info.hash_algo == "SHA256");
    REQUIRE(info.imprint == crypto::Sha256(data));
    REQUIRE(info.serial > 0);
    REQUIRE(info.tsa_name.has_value());
    REQUIRE(info.tsa_name->find("CN=Test TSA") != std::string::npos);
    REQUIRE(info.gen_time >= std::chrono::time_point_cast<std::chrono::seconds>(
                               before) - std::chrono::seconds(1));
    auto json = info.ToJson();
    REQUIRE(json.at("policy").as_string() == "1.2.3.4.1");
  }
  SECTION("serials_increase") {
    auto first = ParseTimestampToken(client.Timestamp(data));
    auto second = ParseTimestampToken(client.Timestamp(data));
    REQUIRE(second.serial > first.serial);
  }
  SECTION("token_verifies") {
    auto token = client.Timestamp(data);
    const std::vector<const crypto::Certificate *> trusted{
      &fixture.trust->Ca()->cert};
    REQUIRE(VerifyTimestampToken(token, data, trusted));
    REQUIRE_FALSE(VerifyTimestampToken(token, BytesVector{'x'}, trusted));
    REQUIRE_FALSE(VerifyTimestampToken(token, data, {}));
    REQUIRE_FALSE(VerifyTimestampToken(BytesVector{1, 2}, data, trusted));
  }
  SECTION("empty_request") {
    REQUIRE_THROWS_AS(fixture.tsa->Respond(BytesVector{}),
                      std::invalid_argument);
  }
  SECTION("garbage_request_rejected") {
    REQUIRE_THROWS_AS(fixture.tsa->Respond(BytesVector{0x30, 0x01, 0x00}),
                      TsaError);
  }
  SECTION("invalid_policy") {
    REQUIRE_THROWS_AS(
      InternalTsa(fixture.trust, fixture.serials, "not an oid"),
      std::invalid_argument);
  }
}

TEST_CASE("TimestampClient") {
  const TsaFixture fixture;
  const BytesVector data{'d', 'a', 't', 'a'};

  SECTION("timeout") {
    const TimestampClient client(std::make_shared<SlowAuthority>(),
                                 std::chrono::milliseconds(20));
    REQUIRE_THROWS_AS(client.Timestamp(data), TsaTimeoutError);
    // let the detached worker finish
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
  }
  SECTION("authority_failure") {
    const TimestampClient client(std::make_shared<BrokenAuthority>(),
                                 std::chrono::milliseconds(1000));
    REQUIRE_THROWS_AS(client.Timestamp(data), TsaError);
  }
  SECTION("replayed_response_rejected") {
    const TimestampClient client(std::make_shared<ReplayAuthority>(fixture.tsa),
                                 std::chrono::milliseconds(5000));
    REQUIRE_NOTHROW(client.Timestamp(data));
    // same request data but a fresh nonce
    REQUIRE_THROWS_AS(client.Timestamp(data), TsaError);
  }
  SECTION("invalid_arguments") {
    REQUIRE_THROWS_AS(TimestampClient(nullptr, std::chrono::milliseconds(1)),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(TimestampClient(fixture.tsa, std::chrono::milliseconds(0)),
                      std::invalid_argument);
    const TimestampClient client(fixture.tsa, std::chrono::milliseconds(1000));
    REQUIRE_THROWS_AS(client.Timestamp(BytesVector{}), std::invalid_argument);
  }
  SECTION("signature_timestamp_in_cms") {
    const TimestampClient client(fixture.tsa, std::chrono::milliseconds(5000));
    const auto &org = fixture.trust->Organisation();
    crypto::CmsSignParams params;
    params.cert = &org.cert;
    params.key = org.key.get();
    params.timestamper = client.AsTimestampFunc();
    auto cms = crypto::SignDetachedCms(data, params);
    auto info = crypto::ParseCmsSignature(cms);
    REQUIRE(info.timestamp_token.has_value());
    auto tst = ParseTimestampToken(info.timestamp_token.value());
    REQUIRE(tst.policy == "1.2.3.4.1");
  }
}
