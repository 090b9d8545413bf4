#include "net/activation_client.hpp"

#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

namespace mdeploy {

namespace {

constexpr std::size_t kMaxKeyLength = 128;
constexpr std::size_t kMaxEchoedBody = 200;

ActivationFailure Fail(ActivationStep step, std::string message, std::string hint, long status = 0) {
    return ActivationFailure{.step = step, .message = std::move(message), .hint = std::move(hint), .http_status = status};
}

std::string Clip(std::string_view body) {
    std::string s(body.substr(0, kMaxEchoedBody));
    if (body.size() > kMaxEchoedBody) s += "...";
    return s;
}

std::optional<long long> IntegerField(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) return std::nullopt;
    return it->get<long long>();
}

} // namespace

const char* ToString(ActivationStep step) {
    switch (step) {
        case ActivationStep::Lookup:  return "lookup";
        case ActivationStep::Verify:  return "verify";
        case ActivationStep::Balance: return "balance";
        case ActivationStep::Consume: return "consume";
    }
    return "unknown";
}

bool IsValidDeviceKey(std::string_view key) {
    if (key.empty() || key.size() > kMaxKeyLength) return false;
    return std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_';
    });
}

std::expected<DeviceRecord, std::string> ParseDeviceRecord(std::string_view body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(std::string("invalid JSON: ") + e.what());
    }
    if (!j.is_object()) return std::unexpected("device record must be a JSON object");

    DeviceRecord rec;
    if (auto it = j.find("token_code"); it != j.end() && it->is_string()) {
        rec.token_code = it->get<std::string>();
    }
    rec.token_count = IntegerField(j, "token_count");
    return rec;
}

std::optional<long long> ParseTokensLeft(std::string_view body) {
    nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    return IntegerField(j, "tokens_left");
}

std::string ActivationClient::DeviceUrl(std::string_view key) {
    return std::string(kActivationAuthority) + "/api/devices/" + std::string(key);
}

std::expected<DeviceRecord, ActivationFailure> ActivationClient::Verify(const DeviceCredential& cred) {
    const std::string authority(kActivationAuthority);

    if (!IsValidDeviceKey(cred.device_key)) {
        return std::unexpected(Fail(ActivationStep::Lookup, "invalid device key format",
                                    "a device key is " + std::string(kDeviceKeyFormat)));
    }
    if (cred.token_code.empty()) {
        return std::unexpected(Fail(ActivationStep::Verify, "invalid token: token code is empty",
                                    "supply the token code associated with this device"));
    }

    // 1. lookup
    LogInfo("Looking up device on %s...", authority.c_str());
    auto resp = http_.Get(DeviceUrl(cred.device_key), timeouts_);
    if (!resp) {
        return std::unexpected(Fail(ActivationStep::Lookup, "device not found: " + resp.error(),
                                    "check that " + authority + " is reachable"));
    }
    if (resp->status != 200) {
        return std::unexpected(Fail(ActivationStep::Lookup,
                                    "device not found: key '" + cred.device_key + "' (HTTP " +
                                        std::to_string(resp->status) + ")",
                                    "verify the device key, or create the device on " + authority,
                                    resp->status));
    }
    auto record = ParseDeviceRecord(resp->body);
    if (!record) {
        return std::unexpected(Fail(ActivationStep::Lookup, "device not found: malformed reply (" + record.error() + ")",
                                    "the authority returned an unexpected body; retry later", resp->status));
    }

    // 2. verify
    if (record->token_code != cred.token_code) {
        return std::unexpected(Fail(ActivationStep::Verify, "invalid token",
                                    "the token code does not match the one registered for this device"));
    }
    LogSuccess("Device key and token code verified");
    return *record;
}

std::expected<ActivationReceipt, ActivationFailure> ActivationClient::Activate(const DeviceCredential& cred) {
    auto record = Verify(cred);
    if (!record) return std::unexpected(record.error());

    const std::string authority(kActivationAuthority);
    const std::string device_url = DeviceUrl(cred.device_key);

    // 3. balance
    if (!record->token_count || *record->token_count <= 0) {
        return std::unexpected(Fail(ActivationStep::Balance, "no activations remaining for this device",
                                    "ask the authority administrator to add tokens: PUT " + device_url +
                                        "/tokens with body {\"token_count\": N}"));
    }
    LogInfo("Tokens available: %lld", *record->token_count);

    // 4. consume
    LogInfo("Consuming one installation token...");
    auto resp = http_.Post(device_url + "/flash-request", std::string{}, timeouts_);
    if (!resp) {
        return std::unexpected(Fail(ActivationStep::Consume, "consumption failed: " + resp.error(),
                                    "the token may or may not have been consumed; check the device on " + authority +
                                        " before retrying"));
    }
    if (resp->status != 200) {
        return std::unexpected(Fail(ActivationStep::Consume,
                                    "consumption failed (HTTP " + std::to_string(resp->status) + "): " + Clip(resp->body),
                                    "check the device on " + authority + " before retrying", resp->status));
    }

    ActivationReceipt receipt{
        .credential = cred,
        .server_url = authority,
        .tokens_before = *record->token_count,
        .tokens_left = ParseTokensLeft(resp->body),
    };
    if (receipt.tokens_left) {
        LogSuccess("Token consumed (remaining: %lld)", *receipt.tokens_left);
    } else {
        LogSuccess("Token consumed (remaining: ?)");
    }
    return receipt;
}

std::string FormatActivationFailure(const ActivationFailure& f) {
    std::string out = "activation failed at step " + std::to_string(static_cast<int>(f.step)) + " (" +
                      ToString(f.step) + "): " + f.message;
    if (!f.hint.empty()) out += "\n  " + f.hint;
    return out;
}

} // namespace mdeploy
