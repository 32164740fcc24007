//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <voltx/memory_quota_ledger.hpp>
//
#include <voltx/memory_quota_ledger.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>

namespace {

using voltx::MemoryQuotaLedger;
using voltx::QuotaDeltas;
using voltx::QuotaLedgerOptions;
using voltx::QuotaUsage;
using voltx::Reservations;
using voltx::StatusCode;

class MemoryQuotaLedgerTest : public ::testing::Test
{
 public:
  static QuotaLedgerOptions test_options()
  {
    return QuotaLedgerOptions{}
        .set_default_limit("volumes", 10)
        .set_default_limit("gigabytes", 1000)
        .set_reservation_expire(std::chrono::seconds{60});
  }

  // Reserves and commits `deltas`, as if the volumes had been created in `project_id`.
  //
  void add_usage(const std::string& project_id, const QuotaDeltas& deltas)
  {
    batt::StatusOr<Reservations> r = this->ledger.reserve(project_id, deltas);
    ASSERT_TRUE(r.ok()) << r.status();
    ASSERT_TRUE(this->ledger.commit(*r).ok());
  }

  MemoryQuotaLedger ledger{test_options()};
};

TEST_F(MemoryQuotaLedgerTest, ReserveCommit)
{
  batt::StatusOr<Reservations> r = this->ledger.reserve("p", {{"volumes", 1}, {"gigabytes", 50}});
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r->project_id, "p");
  EXPECT_EQ(r->ids.size(), 2u);
  EXPECT_EQ(this->ledger.outstanding_reservation_count(), 2u);

  EXPECT_EQ(this->ledger.get_usage("p", "volumes"),
            (QuotaUsage{.in_use = 0, .reserved = 1, .limit = 10}));
  EXPECT_EQ(this->ledger.get_usage("p", "gigabytes"),
            (QuotaUsage{.in_use = 0, .reserved = 50, .limit = 1000}));

  ASSERT_TRUE(this->ledger.commit(*r).ok());

  EXPECT_EQ(this->ledger.get_usage("p", "volumes"),
            (QuotaUsage{.in_use = 1, .reserved = 0, .limit = 10}));
  EXPECT_EQ(this->ledger.get_usage("p", "gigabytes"),
            (QuotaUsage{.in_use = 50, .reserved = 0, .limit = 1000}));
  EXPECT_EQ(this->ledger.outstanding_reservation_count(), 0u);

  // A handle can only be resolved once.
  //
  EXPECT_TRUE(voltx::status_is(this->ledger.commit(*r), StatusCode::kReservationNotFound));
  EXPECT_TRUE(voltx::status_is(this->ledger.rollback(*r), StatusCode::kReservationNotFound));
}

TEST_F(MemoryQuotaLedgerTest, ReserveRollback)
{
  batt::StatusOr<Reservations> r = this->ledger.reserve("p", {{"volumes", 2}});
  ASSERT_TRUE(r.ok());
  ASSERT_TRUE(this->ledger.rollback(*r).ok());

  EXPECT_EQ(this->ledger.get_usage("p", "volumes"),
            (QuotaUsage{.in_use = 0, .reserved = 0, .limit = 10}));
}

TEST_F(MemoryQuotaLedgerTest, NegativeDeltaReleasesOnCommitOnly)
{
  this->add_usage("p", {{"volumes", 3}, {"gigabytes", 30}});

  batt::StatusOr<Reservations> r = this->ledger.reserve("p", {{"volumes", -1}, {"gigabytes", -10}});
  ASSERT_TRUE(r.ok());

  // Nothing moves until commit.
  //
  EXPECT_EQ(this->ledger.get_usage("p", "volumes").in_use, 3);
  EXPECT_EQ(this->ledger.get_usage("p", "volumes").reserved, 0);

  ASSERT_TRUE(this->ledger.commit(*r).ok());

  EXPECT_EQ(this->ledger.get_usage("p", "volumes").in_use, 2);
  EXPECT_EQ(this->ledger.get_usage("p", "gigabytes").in_use, 20);

  // A rolled-back release changes nothing.
  //
  r = this->ledger.reserve("p", {{"volumes", -1}});
  ASSERT_TRUE(r.ok());
  ASSERT_TRUE(this->ledger.rollback(*r).ok());
  EXPECT_EQ(this->ledger.get_usage("p", "volumes").in_use, 2);
}

TEST_F(MemoryQuotaLedgerTest, OverVolumeLimit)
{
  this->add_usage("p", {{"volumes", 9}});

  batt::StatusOr<Reservations> ok = this->ledger.reserve("p", {{"volumes", 1}});
  ASSERT_TRUE(ok.ok());

  // 9 in use + 1 reserved + 1 > 10.
  //
  batt::StatusOr<Reservations> over = this->ledger.reserve("p", {{"volumes", 1}, {"gigabytes", 1}});
  EXPECT_TRUE(voltx::status_is(over.status(), StatusCode::kVolumeLimitExceeded));

  // Nothing from the failed call is held.
  //
  EXPECT_EQ(this->ledger.get_usage("p", "gigabytes").reserved, 0);
  EXPECT_EQ(this->ledger.get_usage("p", "volumes").reserved, 1);
}

TEST_F(MemoryQuotaLedgerTest, OverGigabytesLimitTakesPrecedence)
{
  batt::StatusOr<Reservations> over =
      this->ledger.reserve("p", {{"volumes", 11}, {"gigabytes", 1001}});

  EXPECT_TRUE(voltx::status_is(over.status(), StatusCode::kVolumeSizeExceedsAvailableQuota));
}

TEST_F(MemoryQuotaLedgerTest, TypeSpecificLimits)
{
  // Per-type resources are unlimited unless configured.
  //
  EXPECT_TRUE(this->ledger.reserve("p", {{"volumes_gold", 1000}}).ok());

  ASSERT_TRUE(this->ledger.set_limit("p", "volumes_gold", 0).ok());
  EXPECT_TRUE(voltx::status_is(this->ledger.reserve("p", {{"volumes_gold", 1}}).status(),
                               StatusCode::kVolumeLimitExceeded));

  ASSERT_TRUE(this->ledger.set_limit("p", "gigabytes_gold", 0).ok());
  EXPECT_TRUE(voltx::status_is(this->ledger.reserve("p", {{"gigabytes_gold", 1}}).status(),
                               StatusCode::kVolumeSizeExceedsAvailableQuota));

  ASSERT_TRUE(this->ledger.set_limit("p", "snapshots", 0).ok());
  EXPECT_TRUE(voltx::status_is(this->ledger.reserve("p", {{"snapshots", 1}}).status(),
                               StatusCode::kOverQuota));
}

TEST_F(MemoryQuotaLedgerTest, SetLimit)
{
  ASSERT_TRUE(this->ledger.set_limit("p", "volumes", 1).ok());
  EXPECT_EQ(this->ledger.get_usage("p", "volumes").limit, 1);
  EXPECT_EQ(this->ledger.get_usage("q", "volumes").limit, 10);

  EXPECT_TRUE(this->ledger.reserve("p", {{"volumes", 1}}).ok());
  EXPECT_FALSE(this->ledger.reserve("p", {{"volumes", 1}}).ok());
  EXPECT_TRUE(this->ledger.reserve("q", {{"volumes", 1}}).ok());

  ASSERT_TRUE(this->ledger.set_limit("p", "volumes", voltx::kUnlimitedQuota).ok());
  EXPECT_TRUE(this->ledger.reserve("p", {{"volumes", 100}}).ok());

  EXPECT_EQ(this->ledger.set_limit("p", "volumes", -2),
            batt::Status{batt::StatusCode::kInvalidArgument});
}

TEST_F(MemoryQuotaLedgerTest, ExpireReservations)
{
  batt::StatusOr<Reservations> r1 = this->ledger.reserve("p", {{"volumes", 1}, {"gigabytes", 10}});
  ASSERT_TRUE(r1.ok());

  const voltx::Timestamp now = voltx::Clock::now();

  EXPECT_EQ(this->ledger.expire_reservations(now), 0u);
  EXPECT_EQ(this->ledger.get_usage("p", "gigabytes").reserved, 10);

  EXPECT_EQ(this->ledger.expire_reservations(now + std::chrono::seconds{61}), 2u);
  EXPECT_EQ(this->ledger.get_usage("p", "gigabytes").reserved, 0);
  EXPECT_EQ(this->ledger.get_usage("p", "volumes").reserved, 0);
  EXPECT_EQ(this->ledger.get_usage("p", "volumes").in_use, 0);

  // Committing an expired reservation fails.
  //
  EXPECT_TRUE(voltx::status_is(this->ledger.commit(*r1), StatusCode::kReservationNotFound));
}

TEST(QuotaLedgerOptionsTest, Defaults)
{
  QuotaLedgerOptions options;

  EXPECT_EQ(options.default_limit("volumes"), voltx::kUnlimitedQuota);
  EXPECT_EQ(options.reservation_expire(), std::chrono::seconds{86400});

  options.set_default_limit("volumes", 3);
  EXPECT_EQ(options.default_limit("volumes"), 3);
  EXPECT_EQ(options.default_limit("gigabytes"), voltx::kUnlimitedQuota);
}

TEST(QuotaLedgerOptionsTest, WithDefaultValuesReadsEnvironment)
{
  ::unsetenv("VOLTX_QUOTA_VOLUMES");
  ::unsetenv("VOLTX_QUOTA_GIGABYTES");
  ::unsetenv("VOLTX_RESERVATION_EXPIRE_SECONDS");
  {
    QuotaLedgerOptions options = QuotaLedgerOptions::with_default_values();

    EXPECT_EQ(options.default_limit("volumes"), 10);
    EXPECT_EQ(options.default_limit("gigabytes"), 1000);
    EXPECT_EQ(options.default_limit("volumes_gold"), voltx::kUnlimitedQuota);
    EXPECT_EQ(options.reservation_expire(), std::chrono::seconds{86400});
  }

  ::setenv("VOLTX_QUOTA_VOLUMES", "2", /*overwrite=*/1);
  ::setenv("VOLTX_QUOTA_GIGABYTES", "20", /*overwrite=*/1);
  ::setenv("VOLTX_RESERVATION_EXPIRE_SECONDS", "5", /*overwrite=*/1);
  {
    QuotaLedgerOptions options = QuotaLedgerOptions::with_default_values();

    EXPECT_EQ(options.default_limit("volumes"), 2);
    EXPECT_EQ(options.default_limit("gigabytes"), 20);
    EXPECT_EQ(options.reservation_expire(), std::chrono::seconds{5});
  }
  ::unsetenv("VOLTX_QUOTA_VOLUMES");
  ::unsetenv("VOLTX_QUOTA_GIGABYTES");
  ::unsetenv("VOLTX_RESERVATION_EXPIRE_SECONDS");
}

}  // namespace
