#pragma once

#include "net/http_client.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace mdeploy {

// The activation authority is fixed; it is never read from configuration.
inline constexpr std::string_view kActivationAuthority = "https://meeting.ygsoft.fr";

struct DeviceCredential {
    std::string device_key;
    std::string token_code;

    bool Empty() const { return device_key.empty() && token_code.empty(); }
};

// GET /api/devices/<key>
struct DeviceRecord {
    std::string token_code;
    std::optional<long long> token_count;
};

enum class ActivationStep { Lookup = 1, Verify = 2, Balance = 3, Consume = 4 };

const char* ToString(ActivationStep step);

struct ActivationFailure {
    ActivationStep step = ActivationStep::Lookup;
    std::string message;
    std::string hint;
    long http_status = 0;
};

struct ActivationReceipt {
    DeviceCredential credential;
    std::string server_url;
    long long tokens_before = 0;
    std::optional<long long> tokens_left;
};

// Device keys are used as a URL path segment: [A-Za-z0-9_-]{1,128}.
// Accepted device keys, as shown to the operator.
inline constexpr std::string_view kDeviceKeyFormat = "1 to 128 letters, digits, '-' or '_'";

bool IsValidDeviceKey(std::string_view key);

std::expected<DeviceRecord, std::string> ParseDeviceRecord(std::string_view body);

// "tokens_left" from a flash-request reply; nullopt when absent or unreadable.
std::optional<long long> ParseTokensLeft(std::string_view body);

class ActivationClient {
  public:
    explicit ActivationClient(IHttpClient& http, HttpTimeouts timeouts = kApiTimeouts)
        : http_(http), timeouts_(timeouts) {}

    // Lookup, verify, balance check, then consume exactly one token.
    std::expected<ActivationReceipt, ActivationFailure> Activate(const DeviceCredential& cred);

    // Lookup and verify only. Never consumes.
    std::expected<DeviceRecord, ActivationFailure> Verify(const DeviceCredential& cred);

    static std::string DeviceUrl(std::string_view key);

  private:
    IHttpClient& http_;
    HttpTimeouts timeouts_;
};

// Error line plus indented hint, as printed to the operator.
std::string FormatActivationFailure(const ActivationFailure& f);

} // namespace mdeploy
