#include "engine/algorithms/algorithm_ids.hpp"

#include <cctype>
#include <string>

#include "engine/core/error.hpp"

namespace fuel {
namespace {

template <class E>
struct NameRow {
  E id;
  const char* key;
  const char* label;
};

constexpr NameRow<BmrAlgorithm> kBmrNames[] = {
    {BmrAlgorithm::MifflinStJeor, "mifflin_st_jeor", "Mifflin-St Jeor"},
    {BmrAlgorithm::RevisedHarrisBenedict, "revised_harris_benedict", "Revised Harris-Benedict"},
    {BmrAlgorithm::KatchMcArdle, "katch_mcardle", "Katch-McArdle"},
};

constexpr NameRow<BodyFatAlgorithm> kBodyFatNames[] = {
    {BodyFatAlgorithm::UsNavy, "us_navy", "U.S. Navy"},
    {BodyFatAlgorithm::Bmi, "bmi", "BMI Method"},
};

constexpr NameRow<FatBreakdownAlgorithm> kFatNames[] = {
    {FatBreakdownAlgorithm::AhaGuidelines, "aha_guidelines", "AHA Guidelines"},
};

constexpr NameRow<MineralAlgorithm> kMineralNames[] = {
    {MineralAlgorithm::RdaStandard, "rda_standard", "RDA Standard"},
    {MineralAlgorithm::DashDiet, "dash_diet", "DASH Diet"},
};

constexpr NameRow<VitaminAlgorithm> kVitaminNames[] = {
    {VitaminAlgorithm::RdaStandard, "rda_standard", "RDA Standard"},
    {VitaminAlgorithm::EfsaReference, "efsa_reference", "EFSA Reference Intakes"},
};

constexpr NameRow<SugarAlgorithm> kSugarNames[] = {
    {SugarAlgorithm::WhoGuidelines, "who_guidelines", "WHO Guidelines"},
    {SugarAlgorithm::WhoConditional, "who_conditional", "WHO Conditional (5%)"},
    {SugarAlgorithm::AhaAddedSugar, "aha_added_sugar", "AHA Added Sugar"},
};

// "Mifflin-St Jeor" -> "mifflin_st_jeor", "U.S. Navy" -> "u_s_navy"
std::string normalize(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  bool pending_sep = false;
  for (char c : s) {
    const auto u = static_cast<unsigned char>(c);
    if (std::isalnum(u)) {
      if (pending_sep && !out.empty()) out.push_back('_');
      pending_sep = false;
      out.push_back(static_cast<char>(std::tolower(u)));
    } else {
      pending_sep = true;
    }
  }
  return out;
}

template <class E, std::size_t N>
const NameRow<E>* find_row(const NameRow<E> (&rows)[N], E id) noexcept {
  for (const auto& r : rows) {
    if (r.id == id) return &r;
  }
  return nullptr;
}

template <class E, std::size_t N>
E parse_row(const NameRow<E> (&rows)[N], std::string_view s, const char* category) {
  const std::string k = normalize(s);
  if (!k.empty()) {
    for (const auto& r : rows) {
      if (k == r.key || k == normalize(r.label)) return r.id;
    }
  }
  FUEL_THROW(ErrorCode::kUnknownAlgorithm,
             std::string(category) + " algorithm '" + std::string(s) + "' is not registered");
}

template <class E, std::size_t N>
const char* key_or_unknown(const NameRow<E> (&rows)[N], E id) noexcept {
  const auto* r = find_row(rows, id);
  return r ? r->key : "unknown";
}

}  // namespace

const char* to_string(BmrAlgorithm a) noexcept { return key_or_unknown(kBmrNames, a); }
const char* to_string(BodyFatAlgorithm a) noexcept { return key_or_unknown(kBodyFatNames, a); }
const char* to_string(FatBreakdownAlgorithm a) noexcept { return key_or_unknown(kFatNames, a); }
const char* to_string(MineralAlgorithm a) noexcept { return key_or_unknown(kMineralNames, a); }
const char* to_string(VitaminAlgorithm a) noexcept { return key_or_unknown(kVitaminNames, a); }
const char* to_string(SugarAlgorithm a) noexcept { return key_or_unknown(kSugarNames, a); }

const char* display_label(BmrAlgorithm a) noexcept {
  const auto* r = find_row(kBmrNames, a);
  return r ? r->label : "unknown";
}

const char* display_label(BodyFatAlgorithm a) noexcept {
  const auto* r = find_row(kBodyFatNames, a);
  return r ? r->label : "unknown";
}

BmrAlgorithm parse_bmr_algorithm(std::string_view s) {
  return parse_row(kBmrNames, s, "BMR");
}

BodyFatAlgorithm parse_body_fat_algorithm(std::string_view s) {
  return parse_row(kBodyFatNames, s, "body-fat");
}

FatBreakdownAlgorithm parse_fat_breakdown_algorithm(std::string_view s) {
  return parse_row(kFatNames, s, "fat-breakdown");
}

MineralAlgorithm parse_mineral_algorithm(std::string_view s) {
  return parse_row(kMineralNames, s, "mineral");
}

VitaminAlgorithm parse_vitamin_algorithm(std::string_view s) {
  return parse_row(kVitaminNames, s, "vitamin");
}

SugarAlgorithm parse_sugar_algorithm(std::string_view s) {
  return parse_row(kSugarNames, s, "sugar");
}

bool bmr_uses_body_fat(BmrAlgorithm a) noexcept {
  return a == BmrAlgorithm::KatchMcArdle;
}

}  // namespace fuel
