#pragma once

#include "twsgate/domain/session_error.hpp"

#include <string>

namespace twsgate {

enum class ErrorClass {
  Informational,         // Log only; never reaches a caller
  RequestTerminal,       // The named id can never complete
  NoSecurityDefinition,  // Code 200; request-scoped
  ConnectionFatal,       // Socket is gone or unusable
  Unknown,               // Unlisted code; treated as request-scoped
};

const char* toString(ErrorClass c);

// -----------------------------------------------------------------------------
// ErrorClassifier: gateway error code policy table
// -----------------------------------------------------------------------------
//
// @brief  Maps every numeric code the gateway sends through error() onto
//         one of the ErrorClass buckets, plus the ErrorKind a woken waiter
//         should see.
//
// @details
// The policy is a fixed table:
//
//   Informational         2100..2199 (gateway warnings, e.g. 2104 farm OK,
//                         2174 time zone notice, 2176 fractional shares)
//                         1101 1102 399 10167 10168
//   RequestTerminal       162 165 166 300 321 322 354 366 420
//                         10089 10090 10197 201 202 203
//   NoSecurityDefinition  200
//   ConnectionFatal       504 502 1100
//
// Anything else is Unknown and is handled like RequestTerminal: a caller is
// never left hanging on a code nobody anticipated.
//
// isMarketDataPermission() flags codes that record the sticky "no market
// data entitlement" mark for a symbol. 10167/10168 are informational (the
// gateway falls back to delayed data and keeps streaming) but still mark the
// symbol; 354/10089/10090 also wake the waiter.
//
// isOrderScoped() flags codes that only ever name an order id (rejections,
// cancel outcomes, modify and price-increment errors). Order ids come from
// the gateway and can overlap the request id range, so the session hands
// these to the order tracker before it looks at pending requests.
//
// Thread model: stateless; all members are static.
// -----------------------------------------------------------------------------
class ErrorClassifier {
 public:
  static ErrorClass classify(int code);

  // ErrorKind surfaced to the waiter for a non-informational code.
  static domain::ErrorKind kindFor(int code);

  static bool isMarketDataPermission(int code);

  // Order-scoped outcomes: 201/203 reject, 202 cancel.
  static bool isOrderRejection(int code);
  static bool isOrderCancellation(int code);
  static bool isOrderScoped(int code);

  static domain::SessionError toSessionError(int code,
                                             const std::string& message);
};

}  // namespace twsgate
