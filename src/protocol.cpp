#include "protocol.hpp"

#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace retiresim {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

class JsonWriter {
public:
    JsonWriter() { oss_ << std::setprecision(12); }

    JsonWriter& key(const char* name) {
        separate();
        oss_ << '"' << name << "\":";
        pendingComma_ = false;
        return *this;
    }

    JsonWriter& number(double value) {
        separate();
        if (std::isfinite(value)) {
            oss_ << value;
        } else {
            oss_ << "null";
        }
        pendingComma_ = true;
        return *this;
    }

    template <typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    JsonWriter& integer(Int value) {
        separate();
        oss_ << value;
        pendingComma_ = true;
        return *this;
    }

    JsonWriter& boolean(bool value) {
        separate();
        oss_ << (value ? "true" : "false");
        pendingComma_ = true;
        return *this;
    }

    JsonWriter& string(const std::string& value) {
        separate();
        oss_ << '"' << jsonEscape(value) << '"';
        pendingComma_ = true;
        return *this;
    }

    JsonWriter& null() {
        separate();
        oss_ << "null";
        pendingComma_ = true;
        return *this;
    }

    JsonWriter& beginObject() {
        separate();
        oss_ << '{';
        pendingComma_ = false;
        return *this;
    }

    JsonWriter& endObject() {
        oss_ << '}';
        pendingComma_ = true;
        return *this;
    }

    JsonWriter& beginArray() {
        separate();
        oss_ << '[';
        pendingComma_ = false;
        return *this;
    }

    JsonWriter& endArray() {
        oss_ << ']';
        pendingComma_ = true;
        return *this;
    }

    JsonWriter& numbers(const std::vector<double>& values) {
        beginArray();
        for (double v : values) number(v);
        return endArray();
    }

    [[nodiscard]] std::string str() const { return oss_.str(); }

private:
    void separate() {
        if (pendingComma_) oss_ << ',';
    }

    std::ostringstream oss_;
    bool pendingComma_ = false;
};

void writeBands(JsonWriter& json, const PercentileBands& bands, const char* suffix) {
    const std::string s(suffix);
    json.key(("p10Balances" + s).c_str()).numbers(bands.p10);
    json.key(("p25Balances" + s).c_str()).numbers(bands.p25);
    json.key(("p50Balances" + s).c_str()).numbers(bands.p50);
    json.key(("p75Balances" + s).c_str()).numbers(bands.p75);
    json.key(("p90Balances" + s).c_str()).numbers(bands.p90);
}

void writeBatch(JsonWriter& json, const BatchResult& r) {
    json.beginObject();
    writeBands(json, r.real, "Real");
    writeBands(json, r.nominal, "Nominal");
    json.key("eolReal_p25").number(r.eolReal.p25);
    json.key("eolReal_p50").number(r.eolReal.p50);
    json.key("eolReal_p75").number(r.eolReal.p75);
    json.key("y1AfterTaxReal_p25").number(r.y1AfterTaxReal.p25);
    json.key("y1AfterTaxReal_p50").number(r.y1AfterTaxReal.p50);
    json.key("y1AfterTaxReal_p75").number(r.y1AfterTaxReal.p75);
    json.key("probRuin").number(r.probRuin);
    json.key("meanRothConversions").number(r.meanRothConversions);
    json.key("allRuns").beginArray();
    for (const auto& run : r.runs) {
        json.beginObject();
        json.key("eolReal").number(run.eolReal);
        json.key("y1AfterTaxReal").number(run.y1AfterTaxReal);
        json.key("ruined").boolean(run.ruined);
        json.key("survYrs").integer(run.survivalYears);
        json.endObject();
    }
    json.endArray();
    json.endObject();
}

void writeLegacy(JsonWriter& json, const LegacyResult& r) {
    json.beginObject();
    json.key("years");
    if (r.perpetual) {
        json.null();
    } else {
        json.integer(r.years);
    }
    json.key("perpetual").boolean(r.perpetual);
    json.key("fundLeftReal").number(r.fundLeftReal);
    json.key("lastLivingCount").number(r.lastLivingCount);
    json.key("generationData").beginArray();
    for (const auto& g : r.generations) {
        json.beginObject();
        json.key("generation").integer(g.generation);
        json.key("year").integer(g.year);
        json.key("estateValue").number(g.estateValue);
        json.key("estateTax").number(g.estateTax);
        json.key("netToHeirs").number(g.netToHeirs);
        json.key("fundRealValue").number(g.fundRealValue);
        json.key("livingBeneficiaries").number(g.livingBeneficiaries);
        json.endObject();
    }
    json.endArray();
    json.endObject();
}

void writeGuardrails(JsonWriter& json, const GuardrailsResult& r) {
    json.beginObject();
    json.key("totalFailures").integer(r.totalFailures);
    json.key("preventableFailures").integer(r.preventableFailures);
    json.key("newSuccessRate").number(r.newSuccessRate);
    json.key("baselineSuccessRate").number(r.baselineSuccessRate);
    json.key("improvement").number(r.improvement);
    json.endObject();
}

void writeRmdRows(JsonWriter& json, const std::vector<RmdRow>& rows) {
    json.beginArray();
    for (const auto& row : rows) {
        json.beginObject();
        json.key("age").integer(row.age);
        json.key("rmd").number(row.rmd);
        json.key("tax").number(row.tax);
        json.endObject();
    }
    json.endArray();
}

void writeRoth(JsonWriter& json, const RothOptimizerResult& r) {
    json.beginObject();
    json.key("hasRecommendation").boolean(r.hasRecommendation);
    if (!r.reason.empty()) {
        json.key("reason").string(r.reason);
        json.endObject();
        return;
    }
    json.key("conversions").beginArray();
    for (const auto& c : r.conversions) {
        json.beginObject();
        json.key("age").integer(c.age);
        json.key("conversionAmount").number(c.amount);
        json.key("tax").number(c.tax);
        json.key("pretaxBalanceBefore").number(c.pretaxBalanceBefore);
        json.endObject();
    }
    json.endArray();
    json.key("conversionWindow").beginObject();
    json.key("startAge").integer(r.window.startAge);
    json.key("endAge").integer(r.window.endAge);
    json.key("years").integer(r.window.years);
    json.endObject();
    json.key("totalConverted").number(r.totalConverted);
    json.key("avgAnnualConversion").number(r.avgAnnualConversion);
    json.key("lifetimeTaxSavings").number(r.lifetimeTaxSavings);
    json.key("baselineLifetimeTax").number(r.baselineLifetimeTax);
    json.key("optimizedLifetimeTax").number(r.optimizedLifetimeTax);
    json.key("rmdReduction").number(r.rmdReduction);
    json.key("rmdReductionPercent").number(r.rmdReductionPercent);
    json.key("effectiveRateImprovement").number(r.effectiveRateImprovement);
    json.key("baselineRMDs");
    writeRmdRows(json, r.baselineRmds);
    json.key("optimizedRMDs");
    writeRmdRows(json, r.optimizedRmds);
    json.key("targetBracket").number(r.targetBracketRate);
    json.key("targetBracketLimit").number(r.targetBracketLimit);
    json.endObject();
}

void writeOptimization(JsonWriter& json, const OptimizationResult& r) {
    json.beginObject();
    json.key("surplusAnnual").number(r.surplusAnnual);
    json.key("surplusMonthly").number(r.surplusMonthly);
    json.key("minimumContribution").number(r.minimumContribution);
    json.key("maxSplurge").number(r.maxSplurge);
    json.key("earliestRetirementAge").integer(r.earliestRetirementAge);
    json.key("yearsEarlier").integer(r.yearsEarlier);
    json.endObject();
}

}  // namespace

RequestId requestId(const Request& request) {
    return std::visit([](const auto& r) { return r.id; }, request);
}

RequestId messageId(const Message& message) {
    return std::visit([](const auto& m) { return m.id; }, message);
}

bool isTerminal(const Message& message) {
    return !std::holds_alternative<ProgressMessage>(message);
}

const char* messageType(const Message& message) {
    return std::visit(Overloaded{
                          [](const ProgressMessage&) { return "progress"; },
                          [](const CompleteMessage&) { return "complete"; },
                          [](const LegacyCompleteMessage&) { return "legacy-complete"; },
                          [](const GuardrailsCompleteMessage&) { return "guardrails-complete"; },
                          [](const RothOptimizerCompleteMessage&) { return "roth-optimizer-complete"; },
                          [](const OptimizeCompleteMessage&) { return "optimize-complete"; },
                          [](const ErrorMessage&) { return "error"; },
                      },
                      message);
}

std::string toJson(const Message& message) {
    JsonWriter json;
    json.beginObject();
    json.key("type").string(messageType(message));
    json.key("id").integer(messageId(message));
    std::visit(Overloaded{
                   [&](const ProgressMessage& m) {
                       json.key("completed").integer(m.completed);
                       json.key("total").integer(m.total);
                   },
                   [&](const CompleteMessage& m) {
                       json.key("result");
                       writeBatch(json, m.result);
                   },
                   [&](const LegacyCompleteMessage& m) {
                       json.key("result");
                       writeLegacy(json, m.result);
                   },
                   [&](const GuardrailsCompleteMessage& m) {
                       json.key("result");
                       writeGuardrails(json, m.result);
                   },
                   [&](const RothOptimizerCompleteMessage& m) {
                       json.key("result");
                       writeRoth(json, m.result);
                   },
                   [&](const OptimizeCompleteMessage& m) {
                       json.key("result");
                       writeOptimization(json, m.result);
                   },
                   [&](const ErrorMessage& m) { json.key("message").string(m.message); },
               },
               message);
    json.endObject();
    return json.str();
}

std::string jsonEscape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    return out;
}

}  // namespace retiresim
