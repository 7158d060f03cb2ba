// =============================================================================
// error_classifier_test.cpp
// =============================================================================
// Unit tests for twsgate::ErrorClassifier.
//
// Validates:
//   - Every code in the policy table lands in its class
//   - Unlisted codes are Unknown and still wake waiters (RequestFailed)
//   - Permission codes map to PermissionDenied and are flagged
//   - The 21xx gateway warning band is informational
//   - Order-scoped reject / cancel codes
// =============================================================================

#include "twsgate/errors/error_classifier.hpp"

#include <gtest/gtest.h>

#include <vector>

using twsgate::ErrorClass;
using twsgate::ErrorClassifier;
using twsgate::domain::ErrorKind;

TEST(ErrorClassifierTest, InformationalCodes) {
  const std::vector<int> codes = {2100, 2103, 2104, 2105, 2106, 2107,
                                  2108, 2119, 2150, 2157, 2158, 1101,
                                  1102, 399,  10167, 10168};
  for (int code : codes) {
    EXPECT_EQ(ErrorClassifier::classify(code), ErrorClass::Informational)
        << "code " << code;
  }
}

// Gateway warnings outside the listed codes never fail a request.
TEST(ErrorClassifierTest, WarningBandIsInformational) {
  for (int code : {2101, 2137, 2168, 2174, 2176, 2199}) {
    EXPECT_EQ(ErrorClassifier::classify(code), ErrorClass::Informational)
        << "code " << code;
  }
  EXPECT_EQ(ErrorClassifier::classify(2099), ErrorClass::Unknown);
  EXPECT_EQ(ErrorClassifier::classify(2200), ErrorClass::Unknown);
}

TEST(ErrorClassifierTest, RequestTerminalCodes) {
  const std::vector<int> codes = {162, 165, 166,   300,   321,   322, 354, 366,
                                  420, 10089, 10090, 10197, 201, 202, 203};
  for (int code : codes) {
    EXPECT_EQ(ErrorClassifier::classify(code), ErrorClass::RequestTerminal)
        << "code " << code;
  }
}

TEST(ErrorClassifierTest, NoSecurityDefinition) {
  EXPECT_EQ(ErrorClassifier::classify(200), ErrorClass::NoSecurityDefinition);
  EXPECT_EQ(ErrorClassifier::kindFor(200), ErrorKind::NoSecurityDefinition);
}

TEST(ErrorClassifierTest, ConnectionFatalCodes) {
  for (int code : {504, 502, 1100}) {
    EXPECT_EQ(ErrorClassifier::classify(code), ErrorClass::ConnectionFatal)
        << "code " << code;
    EXPECT_EQ(ErrorClassifier::kindFor(code), ErrorKind::ConnectionLost);
  }
}

// -----------------------------------------------------------------------------
// Unlisted codes are Unknown but still terminate the named request.
// -----------------------------------------------------------------------------
TEST(ErrorClassifierTest, UnknownCodeFailsRequest) {
  EXPECT_EQ(ErrorClassifier::classify(12345), ErrorClass::Unknown);
  EXPECT_EQ(ErrorClassifier::kindFor(12345), ErrorKind::RequestFailed);
  EXPECT_EQ(ErrorClassifier::kindFor(162), ErrorKind::RequestFailed);
}

TEST(ErrorClassifierTest, PermissionCodes) {
  for (int code : {354, 10089, 10090}) {
    EXPECT_TRUE(ErrorClassifier::isMarketDataPermission(code));
    EXPECT_EQ(ErrorClassifier::kindFor(code), ErrorKind::PermissionDenied);
  }
  // Informational, but still mark the symbol.
  EXPECT_TRUE(ErrorClassifier::isMarketDataPermission(10167));
  EXPECT_TRUE(ErrorClassifier::isMarketDataPermission(10168));
  EXPECT_FALSE(ErrorClassifier::isMarketDataPermission(162));
}

TEST(ErrorClassifierTest, OrderScopedCodes) {
  EXPECT_TRUE(ErrorClassifier::isOrderRejection(201));
  EXPECT_TRUE(ErrorClassifier::isOrderRejection(203));
  EXPECT_FALSE(ErrorClassifier::isOrderRejection(202));
  EXPECT_TRUE(ErrorClassifier::isOrderCancellation(202));
  EXPECT_FALSE(ErrorClassifier::isOrderCancellation(201));

  for (int code : {103, 110, 135, 161, 201, 202, 203, 10147, 10148}) {
    EXPECT_TRUE(ErrorClassifier::isOrderScoped(code)) << "code " << code;
  }
  for (int code : {162, 200, 354, 2104, 10089}) {
    EXPECT_FALSE(ErrorClassifier::isOrderScoped(code)) << "code " << code;
  }
}

TEST(ErrorClassifierTest, ToSessionErrorCarriesCodeAndMessage) {
  const auto error = ErrorClassifier::toSessionError(354, "not subscribed");
  EXPECT_EQ(error.kind, ErrorKind::PermissionDenied);
  EXPECT_EQ(error.code, 354);
  EXPECT_EQ(error.message, "not subscribed");
}
