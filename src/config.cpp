// lendpool - Pool configuration implementation

#include "lendpool/config.hpp"
#include "lendpool/errors.hpp"
#include "lendpool/log.hpp"
#include "lendpool/math.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace lendpool {

using json = nlohmann::json;

namespace {

// Accepts a JSON number or a decimal string
uint64_t read_u64(const json& j, const char* key, uint64_t fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return fallback;
    if (it->is_number_unsigned()) return it->get<uint64_t>();
    if (it->is_string()) {
        U128 v = wide::parse_u128(it->get<std::string>());
        if (v > static_cast<U128>(UINT64_MAX)) {
            throw ConfigurationError(std::string(key) + " exceeds 64 bits");
        }
        return static_cast<uint64_t>(v);
    }
    throw ConfigurationError(std::string(key) + " must be an unsigned integer");
}

std::optional<std::set<Address>> read_allow_list(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (!it->is_array()) {
        throw ConfigurationError(std::string(key) + " must be an array of addresses");
    }
    std::set<Address> out;
    for (const auto& entry : *it) {
        out.insert(address_from_hex(entry.get<std::string>()));
    }
    return out;
}

RateModel read_rate_model(const json& j) {
    std::string kind = j.value("kind", "variable");

    if (kind == "variable") {
        VariableRateParams p;
        p.min_utilization = read_u64(j, "min_utilization", p.min_utilization);
        p.max_utilization = read_u64(j, "max_utilization", p.max_utilization);
        p.utilization_precision = read_u64(j, "utilization_precision", p.utilization_precision);
        p.min_interest = read_u64(j, "min_interest", p.min_interest);
        p.max_interest = read_u64(j, "max_interest", p.max_interest);
        p.half_life = read_u64(j, "half_life", p.half_life);
        return p;
    }
    if (kind == "linear") {
        LinearRateParams p;
        p.min_interest = read_u64(j, "min_interest", p.min_interest);
        p.vertex_interest = read_u64(j, "vertex_interest", p.vertex_interest);
        p.max_interest = read_u64(j, "max_interest", p.max_interest);
        p.vertex_utilization = read_u64(j, "vertex_utilization", p.vertex_utilization);
        return p;
    }
    throw ConfigurationError("unknown rate model kind: " + kind);
}

} // namespace

PoolConfig PoolConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigurationError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

PoolConfig PoolConfig::from_json(std::string_view content) {
    PoolConfig config;

    try {
        json j = json::parse(content);
        if (!j.is_object()) {
            throw ConfigurationError("pool config must be a JSON object");
        }

        config.name = j.value("name", std::string{});
        config.general.log_level = j.value("log_level", config.general.log_level);

        config.max_ltv = read_u64(j, "max_ltv", config.max_ltv);
        config.liquidation_fee = read_u64(j, "liquidation_fee", config.liquidation_fee);
        config.fee_to_protocol_rate = read_u64(j, "fee_to_protocol_rate", config.fee_to_protocol_rate);
        config.maturity = read_u64(j, "maturity", config.maturity);
        config.penalty_rate = read_u64(j, "penalty_rate", config.penalty_rate);
        config.initial_rate_per_sec = read_u64(j, "initial_rate_per_sec", config.initial_rate_per_sec);

        if (j.contains("fee_recipient")) {
            config.fee_recipient = address_from_hex(j.at("fee_recipient").get<std::string>());
        }

        if (j.contains("rate_model")) {
            config.rate_model = read_rate_model(j.at("rate_model"));
        }

        if (j.contains("oracle")) {
            const json& o = j.at("oracle");
            config.oracle.max_staleness = read_u64(o, "max_staleness", config.oracle.max_staleness);
            config.oracle.normalization_exponent =
                o.value("normalization_exponent", config.oracle.normalization_exponent);
        }

        config.approved_borrowers = read_allow_list(j, "approved_borrowers");
        config.approved_lenders = read_allow_list(j, "approved_lenders");
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("invalid pool config: ") + e.what());
    }

    config.validate();
    return config;
}

void PoolConfig::validate() const {
    if (max_ltv == 0 || max_ltv > precision::LTV) {
        throw ConfigurationError("max_ltv must be in (0, 100%]");
    }
    if (liquidation_fee > precision::LIQUIDATION) {
        throw ConfigurationError("liquidation_fee exceeds 100%");
    }
    if (fee_to_protocol_rate > precision::FEE) {
        throw ConfigurationError("fee_to_protocol_rate exceeds 100%");
    }
    if (fee_to_protocol_rate > 0 && fee_recipient == Address{}) {
        throw ConfigurationError("fee_to_protocol_rate requires a fee_recipient");
    }
    std::visit([](const auto& params) { lendpool::validate(params); }, rate_model);
    lendpool::validate(oracle);
    log::parse_level(general.log_level);
}

} // namespace lendpool
