#include "fris/features/FeatureStages.hpp"
#include "fris/core/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <numeric>
#include <set>

namespace fris {

namespace Columns {

std::string rollingMean(int window) {
    return "last_" + std::to_string(window) + "_mean_amount";
}

std::string rollingCount(int window) {
    return "last_" + std::to_string(window) + "_count";
}

} // namespace Columns

namespace FeatureStages {

namespace {

constexpr std::time_t SECONDS_PER_DAY = 86400;

// 9999-12-31 23:59:59 UTC, the last second strftime renders as a 4-digit year.
constexpr std::time_t LAST_CALENDAR_SECOND = 253402300799;
constexpr double MAX_TIME = static_cast<double>(LAST_CALENDAR_SECOND - REFERENCE_EPOCH);

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::vector<double> flagColumn(const std::vector<TransactionContext>& contexts,
                               bool TransactionContext::*flag) {
    std::vector<double> out;
    out.reserve(contexts.size());
    for (const auto& c : contexts) out.push_back((c.*flag) ? 1.0 : 0.0);
    return out;
}

} // namespace

const std::vector<std::string>& contextFields() {
    static const std::vector<std::string> fields = {
        Fields::MERCHANT_ID, Fields::DEVICE_TYPE, Fields::GEO_BUCKET,
        Fields::ACCOUNT_ID, Fields::ACCOUNT_AGE
    };
    return fields;
}

const std::vector<std::string>& categoricalFields() {
    static const std::vector<std::string> fields = {
        Fields::MERCHANT_ID, Fields::DEVICE_TYPE, Fields::GEO_BUCKET, Fields::ACCOUNT_ID
    };
    return fields;
}

std::vector<std::string> engineeredColumns(int window) {
    std::vector<std::string> names = {
        Columns::TIMESTAMP, Columns::HOUR, Columns::DAYOFWEEK,
        Columns::AMOUNT_LOG, Columns::AMOUNT_SCALED,
        Columns::MERCHANT_FREQ, Columns::DEVICE_FREQ, Columns::ACCOUNT_TXN_COUNT,
        Columns::rollingMean(window), Columns::rollingCount(window),
        Columns::AMOUNT_TIMES_AGE, Columns::IS_NEW_MERCHANT,
        Columns::PCA_X, Columns::PCA_Y
    };
    for (const auto& f : contextFields()) names.push_back(f + Columns::MISSING_SUFFIX);
    for (const auto& f : categoricalFields()) names.push_back(f + Columns::ENCODED_SUFFIX);
    return names;
}

bool naturalLess(const std::string& a, const std::string& b) {
    size_t i = 0;
    size_t j = 0;
    while (i < a.size() && j < b.size()) {
        if (isDigit(a[i]) && isDigit(b[j])) {
            size_t ie = i;
            size_t je = j;
            while (ie < a.size() && isDigit(a[ie])) ++ie;
            while (je < b.size() && isDigit(b[je])) ++je;

            // Compare digit runs by value: strip leading zeros, then length, then text.
            size_t is = i;
            size_t js = j;
            while (is + 1 < ie && a[is] == '0') ++is;
            while (js + 1 < je && b[js] == '0') ++js;
            if (ie - is != je - js) return (ie - is) < (je - js);
            const int cmp = a.compare(is, ie - is, b, js, je - js);
            if (cmp != 0) return cmp < 0;
            i = ie;
            j = je;
            continue;
        }
        if (a[i] != b[j]) return a[i] < b[j];
        ++i;
        ++j;
    }
    if ((a.size() - i) != (b.size() - j)) return (a.size() - i) < (b.size() - j);
    return a < b;
}

std::vector<std::string> discoverPassthrough(const std::vector<RawRecord>& records,
                                             const std::string& label_column,
                                             const std::string& id_column,
                                             int window) {
    if (records.empty()) {
        throw InputError("cannot discover passthrough columns of an empty batch");
    }

    std::set<std::string> reserved = {Fields::TIME, Fields::AMOUNT, label_column, id_column};
    for (const auto& f : contextFields()) reserved.insert(f);
    for (const auto& f : engineeredColumns(window)) reserved.insert(f);

    std::vector<std::string> out;
    for (const auto& field : records.front().fields()) {
        const std::string& name = field.first;
        if (reserved.count(name)) continue;
        const bool everywhere = std::all_of(records.begin(), records.end(), [&](const RawRecord& r) {
            return r.number(name).has_value();
        });
        if (everywhere) out.push_back(name);
    }
    std::sort(out.begin(), out.end(), naturalLess);
    return out;
}

std::string categoryKey(const FeatureFrame& frame, const std::string& column, size_t row) {
    const FeatureColumn& col = frame.column(column);
    if (col.kind == ColumnKind::NUMERIC) return formatNumber(col.numbers[row]);
    return col.texts[row];
}

std::vector<std::string> categoryKeys(const FeatureFrame& frame, const std::string& column) {
    std::vector<std::string> keys;
    keys.reserve(frame.rows());
    for (size_t i = 0; i < frame.rows(); ++i) keys.push_back(categoryKey(frame, column, i));
    return keys;
}

// -----------------------------------------------------------------------------
// Raw columns
// -----------------------------------------------------------------------------
void rawColumns(FeatureFrame& frame, const std::vector<RawRecord>& records,
                const std::vector<std::string>& passthrough) {
    if (records.size() != frame.rows()) {
        throw PipelineError("frame/record count mismatch");
    }

    std::vector<double> time;
    std::vector<double> amount;
    time.reserve(records.size());
    amount.reserve(records.size());
    for (const auto& rec : records) {
        const double t = rec.requireNumber(Fields::TIME);
        const double a = rec.requireNumber(Fields::AMOUNT);
        if (t < 0.0) throw InputError("Time must be >= 0");
        if (t > MAX_TIME) throw InputError("Time " + formatNumber(t) + " is past year 9999");
        if (a < 0.0) throw InputError("Amount must be >= 0");
        time.push_back(t);
        amount.push_back(a);
    }
    frame.addNumeric(Fields::TIME, std::move(time));
    frame.addNumeric(Fields::AMOUNT, std::move(amount));

    for (const auto& name : passthrough) {
        std::vector<double> values;
        values.reserve(records.size());
        for (const auto& rec : records) {
            if (!rec.has(name)) {
                throw InputError("missing declared field '" + name + "'");
            }
            values.push_back(rec.requireNumber(name));
        }
        frame.addNumeric(name, std::move(values));
    }
}

// -----------------------------------------------------------------------------
// 1. Temporal
// -----------------------------------------------------------------------------
void temporal(FeatureFrame& frame) {
    const auto& time = frame.numeric(Fields::TIME);
    std::vector<std::string> stamp;
    std::vector<double> hour;
    std::vector<double> dow;

    for (double t : time) {
        const std::time_t secs = REFERENCE_EPOCH + static_cast<std::time_t>(std::floor(t));
        std::tm utc{};
        if (!gmtime_r(&secs, &utc)) {
            throw InputError("Time " + formatNumber(t) + " outside calendar range");
        }
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &utc);
        stamp.emplace_back(buf);
        hour.push_back(static_cast<double>(utc.tm_hour));
        dow.push_back(static_cast<double>((utc.tm_wday + 6) % 7));
    }

    frame.addText(Columns::TIMESTAMP, std::move(stamp));
    frame.addNumeric(Columns::HOUR, std::move(hour));
    frame.addNumeric(Columns::DAYOFWEEK, std::move(dow));
}

// -----------------------------------------------------------------------------
// 2. Amount
// -----------------------------------------------------------------------------
void amount(FeatureFrame& frame, const RobustScalerParams& scaler) {
    const auto& amt = frame.numeric(Fields::AMOUNT);
    std::vector<double> logs;
    std::vector<double> scaled;
    logs.reserve(amt.size());
    scaled.reserve(amt.size());
    for (double a : amt) {
        logs.push_back(std::log1p(a));
        scaled.push_back(scaler.apply(a));
    }
    frame.addNumeric(Columns::AMOUNT_LOG, std::move(logs));
    frame.addNumeric(Columns::AMOUNT_SCALED, std::move(scaled));
}

// -----------------------------------------------------------------------------
// 3. Synthetic context
// -----------------------------------------------------------------------------
std::vector<TransactionContext> syntheticContext(FeatureFrame& frame,
                                                 const std::vector<RawRecord>& records,
                                                 const SyntheticContextGenerator& generator) {
    std::vector<TransactionContext> ctx;
    ctx.reserve(records.size());
    for (const auto& rec : records) ctx.push_back(generator.resolve(rec));

    std::vector<double> merchant;
    std::vector<std::string> device;
    std::vector<double> geo;
    std::vector<double> account;
    std::vector<double> age;
    for (const auto& c : ctx) {
        merchant.push_back(c.merchant_id);
        device.push_back(c.device_type);
        geo.push_back(c.geo_bucket);
        account.push_back(c.account_id);
        age.push_back(c.account_age_days);
    }
    frame.addNumeric(Fields::MERCHANT_ID, std::move(merchant));
    frame.addText(Fields::DEVICE_TYPE, std::move(device));
    frame.addNumeric(Fields::GEO_BUCKET, std::move(geo));
    frame.addNumeric(Fields::ACCOUNT_ID, std::move(account));
    frame.addNumeric(Fields::ACCOUNT_AGE, std::move(age));
    return ctx;
}

// -----------------------------------------------------------------------------
// 4. Frequency aggregates (fit-time population)
// -----------------------------------------------------------------------------
void frequencyAggregates(FeatureFrame& frame, const FittedArtifactBundle& bundle) {
    const FrequencyTable& merchants = bundle.table(Fields::MERCHANT_ID);
    const FrequencyTable& devices = bundle.table(Fields::DEVICE_TYPE);
    const FrequencyTable& accounts = bundle.table(Fields::ACCOUNT_ID);

    std::vector<double> mf;
    std::vector<double> df;
    std::vector<double> ac;
    for (size_t i = 0; i < frame.rows(); ++i) {
        mf.push_back(merchants.frequency(categoryKey(frame, Fields::MERCHANT_ID, i)));
        df.push_back(devices.frequency(categoryKey(frame, Fields::DEVICE_TYPE, i)));
        ac.push_back(static_cast<double>(accounts.count(categoryKey(frame, Fields::ACCOUNT_ID, i))));
    }
    frame.addNumeric(Columns::MERCHANT_FREQ, std::move(mf));
    frame.addNumeric(Columns::DEVICE_FREQ, std::move(df));
    frame.addNumeric(Columns::ACCOUNT_TXN_COUNT, std::move(ac));
}

// -----------------------------------------------------------------------------
// 5. Rolling aggregates over strictly prior rows of the same account
// -----------------------------------------------------------------------------
void rollingAggregates(FeatureFrame& frame, int window) {
    if (window < 1) {
        throw PipelineError("rolling window must be >= 1");
    }
    const auto& account = frame.numeric(Fields::ACCOUNT_ID);
    const auto& time = frame.numeric(Fields::TIME);
    const auto& amt = frame.numeric(Fields::AMOUNT);
    const size_t n = frame.rows();

    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        if (account[a] != account[b]) return account[a] < account[b];
        return time[a] < time[b];
    });

    std::vector<double> mean(n, 0.0);
    std::vector<double> count(n, 0.0);
    const size_t w = static_cast<size_t>(window);

    size_t start = 0;
    while (start < n) {
        size_t end = start;
        while (end < n && account[order[end]] == account[order[start]]) ++end;

        for (size_t k = start; k < end; ++k) {
            const size_t from = (k - start > w) ? k - w : start;
            double sum = 0.0;
            for (size_t p = from; p < k; ++p) sum += amt[order[p]];
            const size_t m = k - from;
            count[order[k]] = static_cast<double>(m);
            mean[order[k]] = m ? sum / static_cast<double>(m) : 0.0;
        }
        start = end;
    }

    frame.addNumeric(Columns::rollingMean(window), std::move(mean));
    frame.addNumeric(Columns::rollingCount(window), std::move(count));
}

// -----------------------------------------------------------------------------
// 6. Missingness flags
// -----------------------------------------------------------------------------
void missingFlags(FeatureFrame& frame, const std::vector<TransactionContext>& contexts) {
    if (contexts.size() != frame.rows()) {
        throw PipelineError("context/frame row count mismatch");
    }
    const std::string suffix = Columns::MISSING_SUFFIX;
    frame.addNumeric(Fields::MERCHANT_ID + suffix, flagColumn(contexts, &TransactionContext::merchant_synthesized));
    frame.addNumeric(Fields::DEVICE_TYPE + suffix, flagColumn(contexts, &TransactionContext::device_synthesized));
    frame.addNumeric(Fields::GEO_BUCKET + suffix, flagColumn(contexts, &TransactionContext::geo_synthesized));
    frame.addNumeric(Fields::ACCOUNT_ID + suffix, flagColumn(contexts, &TransactionContext::account_synthesized));
    frame.addNumeric(Fields::ACCOUNT_AGE + suffix, flagColumn(contexts, &TransactionContext::account_age_synthesized));
}

// -----------------------------------------------------------------------------
// 7. Frequency encodings
// -----------------------------------------------------------------------------
void frequencyEncodings(FeatureFrame& frame, const FittedArtifactBundle& bundle) {
    for (const auto& field : categoricalFields()) {
        const FrequencyTable& table = bundle.table(field);
        std::vector<double> enc;
        enc.reserve(frame.rows());
        for (size_t i = 0; i < frame.rows(); ++i) {
            enc.push_back(table.frequency(categoryKey(frame, field, i)));
        }
        frame.addNumeric(field + Columns::ENCODED_SUFFIX, std::move(enc));
    }
}

// -----------------------------------------------------------------------------
// 8. Interactions
// -----------------------------------------------------------------------------
void interactions(FeatureFrame& frame, const FittedArtifactBundle& bundle) {
    const auto& amt = frame.numeric(Fields::AMOUNT);
    const auto& age = frame.numeric(Fields::ACCOUNT_AGE);
    const FrequencyTable& merchants = bundle.table(Fields::MERCHANT_ID);

    std::vector<double> product;
    std::vector<double> fresh;
    for (size_t i = 0; i < frame.rows(); ++i) {
        product.push_back(amt[i] * age[i]);
        fresh.push_back(merchants.count(categoryKey(frame, Fields::MERCHANT_ID, i)) <= 1 ? 1.0 : 0.0);
    }
    frame.addNumeric(Columns::AMOUNT_TIMES_AGE, std::move(product));
    frame.addNumeric(Columns::IS_NEW_MERCHANT, std::move(fresh));
}

// -----------------------------------------------------------------------------
// 9. Projection
// -----------------------------------------------------------------------------
void projection(FeatureFrame& frame, const LinearProjection& proj) {
    if (proj.components.size() != LinearProjection::DEFAULT_COMPONENTS) {
        throw ArtifactError("projection must have exactly 2 components");
    }
    std::vector<const std::vector<double>*> inputs;
    for (const auto& name : proj.input_columns) inputs.push_back(&frame.numeric(name));

    std::vector<double> px;
    std::vector<double> py;
    std::vector<double> x(inputs.size());
    for (size_t i = 0; i < frame.rows(); ++i) {
        for (size_t j = 0; j < inputs.size(); ++j) x[j] = (*inputs[j])[i];
        const auto p = proj.project(x);
        px.push_back(p[0]);
        py.push_back(p[1]);
    }
    frame.addNumeric(Columns::PCA_X, std::move(px));
    frame.addNumeric(Columns::PCA_Y, std::move(py));
}

} // namespace FeatureStages
} // namespace fris
