#include "param_parsing.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace retiresim {

namespace {

std::string lowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trimCopy(const std::string& text) {
    std::size_t begin = 0;
    while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    std::size_t end = text.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

[[noreturn]] void malformed(const std::string& name, const std::string& value, const char* expected) {
    throw std::invalid_argument("Unable to parse " + std::string(expected) + " flag: " + name + "=" + value);
}

double toDouble(const std::string& name, const std::string& raw) {
    const std::string cleaned = trimCopy(raw);
    std::size_t idx = 0;
    double value = 0.0;
    try {
        value = std::stod(cleaned, &idx);
    } catch (const std::logic_error&) {
        malformed(name, raw, "numeric");
    }
    if (cleaned.empty() || idx != cleaned.size()) {
        malformed(name, raw, "numeric");
    }
    return value;
}

long long toInteger(const std::string& name, const std::string& raw) {
    const std::string cleaned = trimCopy(raw);
    std::size_t idx = 0;
    long long value = 0;
    try {
        value = std::stoll(cleaned, &idx);
    } catch (const std::logic_error&) {
        malformed(name, raw, "integer");
    }
    if (cleaned.empty() || idx != cleaned.size()) {
        malformed(name, raw, "integer");
    }
    return value;
}

Contributions parseContributions(const ArgMap& args, const std::string& suffix) {
    Contributions c;
    c.taxable = getDouble(args, "cTax" + suffix, 0.0);
    c.pretax = getDouble(args, "cPre" + suffix, 0.0);
    c.roth = getDouble(args, "cPost" + suffix, 0.0);
    c.employerMatch = getDouble(args, "cMatch" + suffix, 0.0);
    return c;
}

}  // namespace

double getDouble(const ArgMap& args, const std::string& name, double defaultValue) {
    const auto it = args.find(name);
    if (it == args.end()) {
        return defaultValue;
    }
    return toDouble(name, it->second);
}

int getInt(const ArgMap& args, const std::string& name, int defaultValue) {
    const auto it = args.find(name);
    if (it == args.end()) {
        return defaultValue;
    }
    const long long value = toInteger(name, it->second);
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        malformed(name, it->second, "integer");
    }
    return static_cast<int>(value);
}

std::size_t getSizeT(const ArgMap& args, const std::string& name, std::size_t defaultValue) {
    const auto it = args.find(name);
    if (it == args.end()) {
        return defaultValue;
    }
    const long long value = toInteger(name, it->second);
    if (value < 0) {
        malformed(name, it->second, "non-negative integer");
    }
    return static_cast<std::size_t>(value);
}

bool getBool(const ArgMap& args, const std::string& name, bool defaultValue) {
    const auto it = args.find(name);
    if (it == args.end()) {
        return defaultValue;
    }
    const std::string value = lowerCopy(trimCopy(it->second));
    if (value == "true" || value == "1" || value == "yes") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no") {
        return false;
    }
    malformed(name, it->second, "boolean");
}

std::string getString(const ArgMap& args, const std::string& name, std::string defaultValue) {
    const auto it = args.find(name);
    if (it == args.end()) {
        return defaultValue;
    }
    return it->second;
}

std::vector<int> getIntList(const ArgMap& args, const std::string& name, std::vector<int> defaults) {
    const auto it = args.find(name);
    if (it == args.end()) {
        return defaults;
    }
    std::vector<int> values;
    std::stringstream ss(it->second);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (trimCopy(item).empty()) continue;
        const long long value = toInteger(name, item);
        if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
            malformed(name, it->second, "integer list");
        }
        values.push_back(static_cast<int>(value));
    }
    return values;
}

FilingStatus parseFilingStatus(const std::string& text) {
    const std::string value = lowerCopy(text);
    if (value == "single") return FilingStatus::Single;
    if (value == "married") return FilingStatus::Married;
    throw std::invalid_argument("Unknown filing status: " + text);
}

ReturnMode parseReturnMode(const std::string& text) {
    const std::string value = lowerCopy(text);
    if (value == "fixed") return ReturnMode::Fixed;
    if (value == "bootstrap" || value == "randomwalk" || value == "mc") return ReturnMode::Bootstrap;
    if (value == "historical") return ReturnMode::Historical;
    throw std::invalid_argument("Unknown return mode: " + text);
}

ReturnSeries parseReturnSeries(const std::string& text) {
    const std::string value = lowerCopy(text);
    if (value == "nominal") return ReturnSeries::Nominal;
    if (value == "real") return ReturnSeries::Real;
    throw std::invalid_argument("Unknown return series: " + text);
}

GlidePathStrategy parseGlidePathStrategy(const std::string& text) {
    const std::string value = lowerCopy(text);
    if (value == "none") return GlidePathStrategy::None;
    if (value == "aggressive") return GlidePathStrategy::Aggressive;
    if (value == "agebased") return GlidePathStrategy::AgeBased;
    if (value == "custom") return GlidePathStrategy::Custom;
    throw std::invalid_argument("Unknown glide path strategy: " + text);
}

GlidePathShape parseGlidePathShape(const std::string& text) {
    const std::string value = lowerCopy(text);
    if (value == "linear") return GlidePathShape::Linear;
    if (value == "accelerated") return GlidePathShape::Accelerated;
    if (value == "decelerated") return GlidePathShape::Decelerated;
    throw std::invalid_argument("Unknown glide path shape: " + text);
}

SimulationParams parseSimulationParams(const ArgMap& args) {
    SimulationParams p;
    p.filingStatus = parseFilingStatus(getString(args, "marital", "single"));
    p.age1 = getInt(args, "age1", p.age1);
    p.age2 = getInt(args, "age2", p.age1);
    p.retirementAge = getInt(args, "retAge", p.retirementAge);
    p.lifeExpectancy = getInt(args, "lifeExp", p.lifeExpectancy);

    p.taxableBalance = getDouble(args, "sTax", 0.0);
    p.pretaxBalance = getDouble(args, "sPre", 0.0);
    p.rothBalance = getDouble(args, "sPost", 0.0);
    p.emergencyFund = getDouble(args, "emergencyFund", 0.0);

    p.contributions1 = parseContributions(args, "1");
    p.contributions2 = parseContributions(args, "2");
    p.increaseContributions = getBool(args, "incContrib", false);
    p.contributionGrowthPct = getDouble(args, "incRate", 0.0);

    p.returnPct = getDouble(args, "retRate", p.returnPct);
    p.inflationPct = getDouble(args, "infRate", p.inflationPct);
    p.returnMode = parseReturnMode(getString(args, "retMode", "fixed"));
    p.returnSeries = parseReturnSeries(getString(args, "walkSeries", "nominal"));
    p.historicalStartYear = getInt(args, "historicalYear", p.historicalStartYear);
    if (args.count("inflationShockRate") != 0) {
        p.inflationShockPct = getDouble(args, "inflationShockRate", 0.0);
    }
    p.inflationShockYears = getInt(args, "inflationShockDuration", p.inflationShockYears);

    p.glidePath.strategy = parseGlidePathStrategy(getString(args, "glidePath", "none"));
    p.glidePath.startAge = getInt(args, "glideStartAge", p.glidePath.startAge);
    p.glidePath.endAge = getInt(args, "glideEndAge", p.glidePath.endAge);
    p.glidePath.startPct = getDouble(args, "glideStartPct", p.glidePath.startPct);
    p.glidePath.endPct = getDouble(args, "glideEndPct", p.glidePath.endPct);
    p.glidePath.shape = parseGlidePathShape(getString(args, "glideShape", "linear"));

    p.stateTaxPct = getDouble(args, "stateRate", 0.0);
    p.withdrawalPct = getDouble(args, "wdRate", p.withdrawalPct);
    p.dividendYieldPct = getDouble(args, "dividendYield", p.dividendYieldPct);

    p.includeSocialSecurity = getBool(args, "includeSS", false);
    p.socialSecurity1.benefitBasisIncome = getDouble(args, "ssIncome", 0.0);
    p.socialSecurity1.claimAge = getDouble(args, "ssClaimAge", p.socialSecurity1.claimAge);
    p.socialSecurity2.benefitBasisIncome = getDouble(args, "ssIncome2", 0.0);
    p.socialSecurity2.claimAge = getDouble(args, "ssClaimAge2", p.socialSecurity2.claimAge);

    HealthcareParams& h = p.healthcare;
    h.includeMedicare = getBool(args, "includeMedicare", false);
    h.medicarePremiumMonthly = getDouble(args, "medicarePremium", h.medicarePremiumMonthly);
    h.medicalInflationPct = getDouble(args, "medicalInflation", h.medicalInflationPct);
    h.includeLongTermCare = getBool(args, "includeLTC", false);
    h.ltcAnnualCost = getDouble(args, "ltcAnnualCost", h.ltcAnnualCost);
    h.ltcProbabilityPct = getDouble(args, "ltcProbability", h.ltcProbabilityPct);
    h.ltcDurationYears = getDouble(args, "ltcDuration", h.ltcDurationYears);
    h.ltcOnsetAge = getInt(args, "ltcOnsetAge", h.ltcOnsetAge);
    h.includePreMedicare = getBool(args, "includePreMedicare", false);

    p.children.ages = getIntList(args, "childrenAges", {});
    p.children.count = getInt(args, "numChildren", 0);
    p.children.additionalExpected = getInt(args, "additionalChildrenExpected", 0);

    p.rothConversion.enabled = getBool(args, "enableRothConversions", false);
    p.rothConversion.targetBracketRate = getDouble(args, "targetConversionBracket", p.rothConversion.targetBracketRate);

    p.validate();
    return p;
}

BatchConfig parseBatchConfig(const ArgMap& args) {
    BatchConfig cfg;
    const long long seed = toInteger("seed", getString(args, "seed", std::to_string(cfg.baseSeed)));
    if (seed < 0 || seed > std::numeric_limits<std::uint32_t>::max()) {
        malformed("seed", getString(args, "seed", ""), "32-bit seed");
    }
    cfg.baseSeed = static_cast<std::uint32_t>(seed);
    cfg.paths = getSizeT(args, "paths", cfg.paths);
    cfg.progressInterval = getSizeT(args, "progressInterval", cfg.progressInterval);
    cfg.tailTrimFraction = getDouble(args, "trimFraction", cfg.tailTrimFraction);
    if (cfg.paths == 0) {
        throw std::invalid_argument("paths must be positive");
    }
    if (cfg.progressInterval == 0) {
        throw std::invalid_argument("progressInterval must be positive");
    }
    return cfg;
}

RothOptimizerParams parseRothOptimizerParams(const ArgMap& args) {
    RothOptimizerParams p;
    p.filingStatus = parseFilingStatus(getString(args, "marital", "single"));
    p.retirementAge = getInt(args, "retAge", p.retirementAge);
    p.lifeExpectancy = getInt(args, "lifeExp", p.lifeExpectancy);
    p.pretaxBalance = getDouble(args, "pretaxBalance", getDouble(args, "sPre", 0.0));
    p.socialSecurityIncome = getDouble(args, "ssIncome", 0.0);
    p.annualWithdrawal = getDouble(args, "annualWithdrawal", 0.0);
    p.targetBracketRate = getDouble(args, "targetBracket", p.targetBracketRate);
    p.growthRate = getDouble(args, "growthRate", p.growthRate);
    return p;
}

LegacyParams parseLegacyParams(const ArgMap& args) {
    LegacyParams p;
    p.filingStatus = parseFilingStatus(getString(args, "marital", "single"));
    p.eolNominal = getDouble(args, "eolNominal", 0.0);
    p.yearsFromStart = getInt(args, "yearsFromStart", 0);
    p.nominalReturnPct = getDouble(args, "nominalRet", p.nominalReturnPct);
    p.inflationPct = getDouble(args, "inflPct", p.inflationPct);
    p.perBeneficiaryReal = getDouble(args, "perBenReal", 0.0);
    p.startBeneficiaries = getInt(args, "startBens", p.startBeneficiaries);
    p.totalFertilityRate = getDouble(args, "totalFertilityRate", p.totalFertilityRate);
    p.generationLength = getInt(args, "generationLength", p.generationLength);
    p.deathAge = getInt(args, "deathAge", p.deathAge);
    p.minDistributionAge = getInt(args, "minDistAge", p.minDistributionAge);
    p.capYears = getInt(args, "capYears", p.capYears);
    p.initialBeneficiaryAges = getIntList(args, "initialBenAges", p.initialBeneficiaryAges);
    p.fertilityWindowStart = getInt(args, "fertilityWindowStart", p.fertilityWindowStart);
    p.fertilityWindowEnd = getInt(args, "fertilityWindowEnd", p.fertilityWindowEnd);
    return p;
}

double parseSpendingReduction(const ArgMap& args) {
    const double reduction = getDouble(args, "spendingReduction", 0.1);
    if (reduction < 0.0) {
        throw std::invalid_argument("spendingReduction must be non-negative");
    }
    return reduction;
}

}  // namespace retiresim
