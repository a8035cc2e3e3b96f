#include "engine_worker.hpp"
#include "param_parsing.hpp"
#include "protocol.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

using namespace retiresim;

namespace {

enum class OutputFormat { Text, Json };

void printUsage(const char* exe) {
    std::cout << "Usage:\n"
              << "  " << exe << " <command> [options]\n\n"
              << "Commands:\n"
              << "  run         Monte Carlo batch: percentile bands and ruin probability\n"
              << "  optimize    Surplus savings, maximum splurge and earliest retirement age\n"
              << "  guardrails  Run a batch, then estimate a dynamic spending cut\n"
              << "  roth        Deterministic Roth conversion comparison\n"
              << "  legacy      Multi-generation dynasty fund model\n\n"
              << "Common Options:\n"
              << "  --format <text|json>      Output format (default: text)\n"
              << "  --returns-csv <path>      year,returnPct history (default: built-in S&P 500)\n\n"
              << "Household (run, optimize, guardrails):\n"
              << "  --marital <single|married> --age1 N --age2 N --retAge N --lifeExp N\n"
              << "  --sTax --sPre --sPost --emergencyFund   Starting balances\n"
              << "  --cTax1 --cPre1 --cPost1 --cMatch1     Annual contributions (2 for spouse)\n"
              << "  --incContrib <bool> --incRate <pct>     Contribution growth\n"
              << "  --retRate <pct> --infRate <pct>         Return and inflation (default: 9.8 / 2.6)\n"
              << "  --retMode <fixed|bootstrap|historical> --walkSeries <nominal|real>\n"
              << "  --historicalYear N --inflationShockRate <pct> --inflationShockDuration N\n"
              << "  --glidePath <none|aggressive|ageBased|custom> --glideStartAge --glideEndAge\n"
              << "  --glideStartPct --glideEndPct --glideShape <linear|accelerated|decelerated>\n"
              << "  --stateRate <pct> --wdRate <pct> --dividendYield <pct>\n"
              << "  --includeSS <bool> --ssIncome --ssClaimAge --ssIncome2 --ssClaimAge2\n"
              << "  --includeMedicare --medicarePremium --medicalInflation --includePreMedicare\n"
              << "  --includeLTC --ltcAnnualCost --ltcProbability --ltcDuration --ltcOnsetAge\n"
              << "  --numChildren N --childrenAges a,b,c --additionalChildrenExpected N\n"
              << "  --enableRothConversions <bool> --targetConversionBracket <decimal>\n"
              << "  --seed N --paths N (default: 2000) --progressInterval N --trimFraction <decimal>\n\n"
              << "Guardrails Options:\n"
              << "  --spendingReduction <decimal>   Spending cut (default: 0.1)\n\n"
              << "Roth Options:\n"
              << "  --retAge --pretaxBalance --marital --ssIncome --annualWithdrawal\n"
              << "  --targetBracket <decimal> --growthRate <decimal>\n\n"
              << "Legacy Options:\n"
              << "  --marital single|married --eolNominal --yearsFromStart --nominalRet --inflPct --perBenReal --startBens\n"
              << "  --totalFertilityRate --generationLength --deathAge --minDistAge --capYears\n"
              << "  --initialBenAges a,b --fertilityWindowStart --fertilityWindowEnd\n";
}

ArgMap parseArgs(int argc, char** argv, int startIndex) {
    ArgMap args;
    for (int i = startIndex; i < argc; ++i) {
        std::string token = argv[i];
        if (token.rfind("--", 0) != 0) {
            throw std::invalid_argument("Unexpected token: " + token);
        }

        token = token.substr(2);
        const auto pos = token.find('=');
        if (pos != std::string::npos) {
            args[token.substr(0, pos)] = token.substr(pos + 1);
        } else {
            std::string value = "true";
            if (i + 1 < argc) {
                std::string potential = argv[i + 1];
                if (potential.rfind("--", 0) != 0) {
                    value = potential;
                    ++i;
                }
            }
            args[token] = value;
        }
    }
    return args;
}

int detectThreads() {
#ifdef _OPENMP
    return omp_get_max_threads();
#else
    return 1;
#endif
}

OutputFormat parseFormat(const ArgMap& args) {
    std::string fmt = getString(args, "format", "text");
    std::transform(fmt.begin(), fmt.end(), fmt.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (fmt == "json") {
        return OutputFormat::Json;
    }
    if (fmt != "text") {
        throw std::invalid_argument("Unsupported format: " + fmt);
    }
    return OutputFormat::Text;
}

void printBatch(const BatchResult& r) {
    std::cout << std::fixed << std::setprecision(0);
    std::cout << "Probability of ruin      : " << std::setprecision(2) << r.probRuin * 100.0 << "%\n"
              << std::setprecision(0)
              << "End-of-life real p25/50/75: " << r.eolReal.p25 << " / " << r.eolReal.p50 << " / "
              << r.eolReal.p75 << "\n"
              << "Year-1 after-tax real p50 : " << r.y1AfterTaxReal.p50 << "\n"
              << "Paths                     : " << r.runs.size() << "\n\n";

    std::cout << std::setw(6) << "Year" << std::setw(16) << "p10 real" << std::setw(16) << "p50 real"
              << std::setw(16) << "p90 real" << "\n";
    for (std::size_t t = 0; t < r.real.p50.size(); t += 5) {
        std::cout << std::setw(6) << t << std::setw(16) << r.real.p10[t] << std::setw(16) << r.real.p50[t]
                  << std::setw(16) << r.real.p90[t] << "\n";
    }
}

void printGuardrails(const GuardrailsResult& r) {
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Failed paths           : " << r.totalFailures << "\n"
              << "Preventable (estimate) : " << r.preventableFailures << "\n"
              << "Baseline success rate  : " << r.baselineSuccessRate * 100.0 << "%\n"
              << "With guardrails        : " << r.newSuccessRate * 100.0 << "%\n"
              << "Improvement            : " << r.improvement * 100.0 << " pts\n";
}

void printRoth(const RothOptimizerResult& r) {
    if (!r.reason.empty()) {
        std::cout << "No recommendation: " << r.reason << "\n";
        return;
    }
    std::cout << std::fixed << std::setprecision(0);
    std::cout << "Recommendation         : " << (r.hasRecommendation ? "convert" : "do not convert") << "\n"
              << "Conversion window      : " << r.window.startAge << "-" << r.window.endAge << " ("
              << r.window.years << " years)\n"
              << "Total converted        : " << r.totalConverted << "\n"
              << "Average per year       : " << r.avgAnnualConversion << "\n"
              << "Lifetime tax baseline  : " << r.baselineLifetimeTax << "\n"
              << "Lifetime tax optimized : " << r.optimizedLifetimeTax << "\n"
              << "Lifetime tax savings   : " << r.lifetimeTaxSavings << "\n"
              << "RMD reduction          : " << r.rmdReduction << " (" << std::setprecision(1)
              << r.rmdReductionPercent << "%)\n";
}

void printLegacy(const LegacyResult& r) {
    std::cout << std::fixed << std::setprecision(0);
    if (r.perpetual) {
        std::cout << "Years sustained        : perpetual\n";
    } else {
        std::cout << "Years sustained        : " << r.years << "\n";
    }
    std::cout << "Real fund remaining    : " << r.fundLeftReal << "\n"
              << "Living beneficiaries   : " << std::setprecision(1) << r.lastLivingCount << "\n";
    for (const auto& g : r.generations) {
        std::cout << "  generation " << g.generation << " (year " << g.year << "): estate " << std::setprecision(0)
                  << g.estateValue << ", tax " << g.estateTax << ", net " << g.netToHeirs << "\n";
    }
}

void printOptimization(const OptimizationResult& r) {
    std::cout << std::fixed << std::setprecision(0);
    std::cout << "Minimum contribution   : " << r.minimumContribution << " / year\n"
              << "Surplus savings        : " << r.surplusAnnual << " / year (" << r.surplusMonthly
              << " / month)\n"
              << "Maximum one-time spend : " << r.maxSplurge << "\n"
              << "Earliest retirement age: " << r.earliestRetirementAge << " (" << r.yearsEarlier
              << " years earlier)\n";
}

void printText(const Message& message) {
    std::visit(
        [](const auto& m) {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, ProgressMessage>) {
                std::cerr << "\r[retiresim] " << m.completed << "/" << m.total << " paths" << std::flush;
                if (m.completed == m.total) std::cerr << "\n";
            } else if constexpr (std::is_same_v<T, CompleteMessage>) {
                printBatch(m.result);
            } else if constexpr (std::is_same_v<T, LegacyCompleteMessage>) {
                printLegacy(m.result);
            } else if constexpr (std::is_same_v<T, GuardrailsCompleteMessage>) {
                printGuardrails(m.result);
            } else if constexpr (std::is_same_v<T, RothOptimizerCompleteMessage>) {
                printRoth(m.result);
            } else if constexpr (std::is_same_v<T, OptimizeCompleteMessage>) {
                printOptimization(m.result);
            } else {
                std::cerr << "Runtime error: " << m.message << "\n";
            }
        },
        message);
}

EngineData loadEngineData(const ArgMap& args) {
    const auto it = args.find("returns-csv");
    if (it == args.end()) {
        return EngineData::defaults();
    }
    return EngineData(TaxTables::us2026(), HistoricalSeries::loadFromCsv(it->second));
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    const std::string command = argv[1];
    if (command == "--help" || command == "help") {
        printUsage(argv[0]);
        return 0;
    }

    ArgMap args;
    try {
        args = parseArgs(argc, argv, 2);
    } catch (const std::exception& ex) {
        std::cerr << "Argument error: " << ex.what() << "\n";
        printUsage(argv[0]);
        return 1;
    }

    OutputFormat format = OutputFormat::Text;
    bool formatParsed = false;

    try {
        format = parseFormat(args);
        formatParsed = true;
        const EngineData data = loadEngineData(args);

        if (format == OutputFormat::Text) {
            std::cout << "Retirement Monte Carlo Engine\n"
                      << "OpenMP threads: " << detectThreads() << "\n\n";
        }

        bool failed = false;
        const MessageSink sink = [&](const Message& message) {
            if (std::holds_alternative<ErrorMessage>(message)) failed = true;
            if (format == OutputFormat::Json) {
                if (isTerminal(message)) std::cout << toJson(message) << "\n";
            } else {
                printText(message);
            }
        };

        if (command == "run") {
            dispatch(RunRequest{1, parseSimulationParams(args), parseBatchConfig(args)}, data, sink);
        } else if (command == "optimize") {
            const BatchConfig batch = parseBatchConfig(args);
            dispatch(OptimizeRequest{1, parseSimulationParams(args), batch.baseSeed}, data, sink);
        } else if (command == "guardrails") {
            const BatchRunner runner(data);
            const BatchResult batch = runner.run(parseSimulationParams(args), parseBatchConfig(args));
            dispatch(GuardrailsRequest{1, batch.runs, parseSpendingReduction(args)}, data, sink);
        } else if (command == "roth") {
            dispatch(RothOptimizerRequest{1, parseRothOptimizerParams(args)}, data, sink);
        } else if (command == "legacy") {
            dispatch(LegacyRequest{1, parseLegacyParams(args)}, data, sink);
        } else {
            if (format == OutputFormat::Json) {
                std::cout << toJson(ErrorMessage{0, "Unknown command: " + command}) << "\n";
            } else {
                std::cerr << "Unknown command: " << command << "\n\n";
                printUsage(argv[0]);
            }
            return 1;
        }
        return failed ? 1 : 0;
    } catch (const std::exception& ex) {
        if (formatParsed && format == OutputFormat::Json) {
            std::cout << toJson(ErrorMessage{0, ex.what()}) << "\n";
            return 1;
        }
        std::cerr << "Runtime error: " << ex.what() << "\n";
        return 1;
    }
}
