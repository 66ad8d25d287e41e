#include "fris/features/SyntheticContext.hpp"
#include "fris/store/Digest.hpp"
#include "fris/core/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace fris {

namespace {

constexpr double TWO_POW_53 = 9007199254740992.0;

double toUnit(uint64_t bits) {
    return static_cast<double>(bits >> 11) / TWO_POW_53;
}

std::mt19937_64 streamFor(uint64_t seed, const std::string& name) {
    return std::mt19937_64(Digest::sha256Prefix64(std::to_string(seed) + "|catalog|" + name));
}

std::vector<double> exponentialCdf(std::mt19937_64& rng, size_t n) {
    std::vector<double> w(n);
    double total = 0.0;
    for (size_t i = 0; i < n; ++i) {
        w[i] = -std::log1p(-toUnit(rng()));
        total += w[i];
    }
    double acc = 0.0;
    for (size_t i = 0; i < n; ++i) {
        acc += w[i];
        w[i] = acc / total;
    }
    w.back() = 1.0;
    return w;
}

size_t pick(const std::vector<double>& cdf, double u) {
    auto it = std::upper_bound(cdf.begin(), cdf.end(), u);
    if (it == cdf.end()) return cdf.size() - 1;
    return static_cast<size_t>(it - cdf.begin());
}

bool isCatalogueIndex(double v, size_t n) {
    return v >= 0.0 && v < static_cast<double>(n) && v == std::floor(v);
}

} // namespace

std::shared_ptr<const SyntheticCatalog> SyntheticCatalog::build(uint64_t seed) {
    auto cat = std::make_shared<SyntheticCatalog>();
    cat->seed = seed;

    auto merchants = streamFor(seed, "merchant");
    cat->merchant_cdf = exponentialCdf(merchants, NUM_MERCHANTS);

    auto geo = streamFor(seed, "geo");
    cat->geo_cdf = exponentialCdf(geo, NUM_GEO);

    auto accounts = streamFor(seed, "account");
    cat->account_cdf = exponentialCdf(accounts, NUM_ACCOUNTS);

    auto ages = streamFor(seed, "account_age");
    cat->account_age.resize(NUM_ACCOUNTS);
    for (auto& a : cat->account_age) {
        a = static_cast<int>(toUnit(ages()) * MAX_ACCOUNT_AGE_DAYS);
    }
    return cat;
}

SyntheticContextGenerator::SyntheticContextGenerator(std::shared_ptr<const SyntheticCatalog> catalog,
                                                     std::string id_column)
    : catalog_(std::move(catalog)), id_column_(std::move(id_column)) {
    if (!catalog_) {
        throw ArtifactError("synthetic context catalogue not built");
    }
}

std::string SyntheticContextGenerator::recordKey(const RawRecord& rec) const {
    if (!id_column_.empty()) {
        if (const FieldValue* id = rec.find(id_column_)) {
            return "id=" + canonicalText(*id);
        }
    }
    return "t=" + formatNumber(rec.requireNumber(Fields::TIME)) +
           "|a=" + formatNumber(rec.requireNumber(Fields::AMOUNT));
}

double SyntheticContextGenerator::uniform(const std::string& field, const std::string& key) const {
    std::mt19937_64 rng(Digest::sha256Prefix64(std::to_string(catalog_->seed) + "|" + field + "|" + key));
    return toUnit(rng());
}

TransactionContext SyntheticContextGenerator::resolve(const RawRecord& rec) const {
    const std::string key = recordKey(rec);
    TransactionContext ctx;

    auto numericField = [&](const char* name, double& out, bool& synthesized,
                             const std::vector<double>& cdf) {
        const FieldValue* v = rec.find(name);
        if (v) {
            const auto* d = std::get_if<double>(v);
            if (!d || !std::isfinite(*d)) {
                throw InputError(std::string("context field '") + name + "' must be a finite number");
            }
            out = *d;
            return;
        }
        out = static_cast<double>(pick(cdf, uniform(name, key)));
        synthesized = true;
    };

    numericField(Fields::MERCHANT_ID, ctx.merchant_id, ctx.merchant_synthesized, catalog_->merchant_cdf);
    numericField(Fields::GEO_BUCKET, ctx.geo_bucket, ctx.geo_synthesized, catalog_->geo_cdf);
    numericField(Fields::ACCOUNT_ID, ctx.account_id, ctx.account_synthesized, catalog_->account_cdf);

    if (const FieldValue* v = rec.find(Fields::DEVICE_TYPE)) {
        const auto* s = std::get_if<std::string>(v);
        if (!s || s->empty()) {
            throw InputError("context field 'device_type' must be a non-empty string");
        }
        ctx.device_type = *s;
    } else {
        const double u = uniform(Fields::DEVICE_TYPE, key);
        size_t idx = 0;
        while (idx + 1 < SyntheticCatalog::DEVICE_CDF.size() && u >= SyntheticCatalog::DEVICE_CDF[idx]) ++idx;
        ctx.device_type = SyntheticCatalog::DEVICE_TYPES[idx];
        ctx.device_synthesized = true;
    }

    if (const FieldValue* v = rec.find(Fields::ACCOUNT_AGE)) {
        const auto* d = std::get_if<double>(v);
        if (!d || !std::isfinite(*d) || *d < 0.0) {
            throw InputError("context field 'account_age_days' must be a non-negative number");
        }
        ctx.account_age_days = *d;
    } else {
        // Age belongs to the account, not to the transaction.
        if (isCatalogueIndex(ctx.account_id, SyntheticCatalog::NUM_ACCOUNTS)) {
            ctx.account_age_days = catalog_->account_age[static_cast<size_t>(ctx.account_id)];
        } else {
            const double u = uniform(Fields::ACCOUNT_AGE, "account=" + formatNumber(ctx.account_id));
            ctx.account_age_days = std::floor(u * SyntheticCatalog::MAX_ACCOUNT_AGE_DAYS);
        }
        ctx.account_age_synthesized = true;
    }
    return ctx;
}

} // namespace fris
