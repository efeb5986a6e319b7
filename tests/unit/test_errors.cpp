#include "common/Errors.hpp"

#include "common/Types.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace ddns::common;

TEST(ErrorsTest, AppErrorCarriesCode) {
  AppError err("internal_error", "Something went wrong");
  EXPECT_EQ(err._sErrorCode, "internal_error");
  EXPECT_STREQ(err.what(), "Something went wrong");
}

TEST(ErrorsTest, ConfigErrorIsCatchableAsAppError) {
  try {
    throw ConfigError("missing_domain", "PORKBUN_DOMAIN is not set");
  } catch (const AppError& err) {
    EXPECT_EQ(err._sErrorCode, "missing_domain");
    EXPECT_STREQ(err.what(), "PORKBUN_DOMAIN is not set");
  }
}

TEST(ErrorsTest, TransportErrorIsCatchableAsStdRuntimeError) {
  try {
    throw TransportError("timeout", "connect timed out");
  } catch (const std::runtime_error& err) {
    EXPECT_STREQ(err.what(), "connect timed out");
  }
}

TEST(ErrorsTest, ResultVariantsReportOk) {
  FetchResult fr;
  EXPECT_TRUE(fr.ok());
  fr.oError = ApiError{ApiErrorKind::RateLimited, "slow down"};
  EXPECT_FALSE(fr.ok());

  UpdateResult ur;
  EXPECT_TRUE(ur.ok());

  ResolveResult rs;
  rs.oError = ResolveError::InvalidFormat;
  EXPECT_FALSE(rs.ok());
}

TEST(ErrorsTest, EnumNamesAreStable) {
  EXPECT_STREQ(toString(ApiErrorKind::Unauthorized), "unauthorized");
  EXPECT_STREQ(toString(ApiErrorKind::RateLimited), "rate_limited");
  EXPECT_STREQ(toString(ApiErrorKind::Transient), "transient");
  EXPECT_STREQ(toString(ResolveError::Unreachable), "unreachable");
  EXPECT_STREQ(toString(ResolveError::InvalidFormat), "invalid_format");
  EXPECT_STREQ(toString(TargetAction::UpdateFailed), "update_failed");
  EXPECT_STREQ(toString(HealthStatus::Ok), "ok");
}

TEST(ErrorsTest, CycleReportCountsByAction) {
  CycleReport crp;
  crp.vOutcomes.push_back(TargetOutcome{"a.example.com", TargetAction::Updated, "", {}});
  crp.vOutcomes.push_back(TargetOutcome{"b.example.com", TargetAction::Updated, "", {}});
  crp.vOutcomes.push_back(TargetOutcome{"example.com", TargetAction::Missing, "", {}});
  EXPECT_EQ(crp.count(TargetAction::Updated), 2);
  EXPECT_EQ(crp.count(TargetAction::Missing), 1);
  EXPECT_EQ(crp.count(TargetAction::FetchFailed), 0);
}
