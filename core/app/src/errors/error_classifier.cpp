#include "twsgate/errors/error_classifier.hpp"

#include <algorithm>
#include <iterator>

namespace twsgate {

namespace {

constexpr int kInformational[] = {2100, 2103, 2104, 2105, 2106, 2107,
                                  2108, 2119, 2150, 2157, 2158, 1101,
                                  1102, 399,  10167, 10168};

constexpr int kRequestTerminal[] = {162, 165, 166,   300,   321,
                                    322, 354, 366,   420,   10089,
                                    10090, 10197, 201, 202, 203};

constexpr int kConnectionFatal[] = {504, 502, 1100};

constexpr int kPermission[] = {354, 10089, 10090, 10167, 10168};

// Codes whose id field names an order, never a request.
constexpr int kOrderScoped[] = {103, 104, 105, 106, 107, 109, 110, 111,
                                135, 136, 161, 201, 202, 203, 10147, 10148};

constexpr int kNoSecurityDefinition = 200;

// Gateway warning band. Everything in it is advisory.
constexpr int kWarningBandFirst = 2100;
constexpr int kWarningBandLast = 2199;

template <std::size_t N>
bool contains(const int (&table)[N], int code) {
  return std::find(std::begin(table), std::end(table), code) !=
         std::end(table);
}

}  // namespace

const char* toString(ErrorClass c) {
  switch (c) {
    case ErrorClass::Informational:        return "Informational";
    case ErrorClass::RequestTerminal:      return "RequestTerminal";
    case ErrorClass::NoSecurityDefinition: return "NoSecurityDefinition";
    case ErrorClass::ConnectionFatal:      return "ConnectionFatal";
    case ErrorClass::Unknown:              return "Unknown";
  }
  return "Unknown";
}

ErrorClass ErrorClassifier::classify(int code) {
  if (contains(kInformational, code) ||
      (code >= kWarningBandFirst && code <= kWarningBandLast)) {
    return ErrorClass::Informational;
  }
  if (code == kNoSecurityDefinition) {
    return ErrorClass::NoSecurityDefinition;
  }
  if (contains(kConnectionFatal, code)) {
    return ErrorClass::ConnectionFatal;
  }
  if (contains(kRequestTerminal, code)) {
    return ErrorClass::RequestTerminal;
  }
  return ErrorClass::Unknown;
}

domain::ErrorKind ErrorClassifier::kindFor(int code) {
  if (code == kNoSecurityDefinition) {
    return domain::ErrorKind::NoSecurityDefinition;
  }
  if (contains(kConnectionFatal, code)) {
    return domain::ErrorKind::ConnectionLost;
  }
  if (isMarketDataPermission(code)) {
    return domain::ErrorKind::PermissionDenied;
  }
  return domain::ErrorKind::RequestFailed;
}

bool ErrorClassifier::isMarketDataPermission(int code) {
  return contains(kPermission, code);
}

bool ErrorClassifier::isOrderRejection(int code) {
  return code == 201 || code == 203;
}

bool ErrorClassifier::isOrderCancellation(int code) { return code == 202; }

bool ErrorClassifier::isOrderScoped(int code) {
  return contains(kOrderScoped, code);
}

domain::SessionError ErrorClassifier::toSessionError(
    int code, const std::string& message) {
  return domain::SessionError{kindFor(code), code, message};
}

}  // namespace twsgate
