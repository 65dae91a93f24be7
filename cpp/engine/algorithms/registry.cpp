#include "engine/algorithms/registry.hpp"

#include <string>

#include "engine/algorithms/bmr_formulas.hpp"
#include "engine/algorithms/body_fat_formulas.hpp"
#include "engine/algorithms/nutrient_formulas.hpp"
#include "engine/core/error.hpp"

namespace fuel::registry {
namespace {

template <class E>
[[noreturn]] void unknown_tag(const char* category, E id) {
  FUEL_THROW(ErrorCode::kUnknownAlgorithm,
             std::string(category) + " algorithm tag " +
                 std::to_string(static_cast<int>(id)) + " is not registered");
}

}  // namespace

std::optional<double> evaluate_bmr(BmrAlgorithm id, const BmrInput& in) {
  switch (id) {
    case BmrAlgorithm::MifflinStJeor:         return bmr::mifflin_st_jeor(in);
    case BmrAlgorithm::RevisedHarrisBenedict: return bmr::revised_harris_benedict(in);
    case BmrAlgorithm::KatchMcArdle:          return bmr::katch_mcardle(in);
  }
  unknown_tag("BMR", id);
}

std::optional<double> estimate_body_fat(BodyFatAlgorithm id, const BodyFatInput& in) {
  switch (id) {
    case BodyFatAlgorithm::UsNavy: return body_fat::us_navy(in);
    case BodyFatAlgorithm::Bmi:    return body_fat::bmi_method(in);
  }
  unknown_tag("body-fat", id);
}

FatBreakdown split_fat(FatBreakdownAlgorithm id, const FatBreakdownInput& in) {
  switch (id) {
    case FatBreakdownAlgorithm::AhaGuidelines: return nutrients::aha_fat_breakdown(in);
  }
  unknown_tag("fat-breakdown", id);
}

MineralTargets mineral_targets(MineralAlgorithm id, const NutrientProfileInput& in) {
  switch (id) {
    case MineralAlgorithm::RdaStandard: return nutrients::rda_minerals(in);
    case MineralAlgorithm::DashDiet:    return nutrients::dash_minerals(in);
  }
  unknown_tag("mineral", id);
}

VitaminTargets vitamin_targets(VitaminAlgorithm id, const NutrientProfileInput& in) {
  switch (id) {
    case VitaminAlgorithm::RdaStandard:   return nutrients::rda_vitamins(in);
    case VitaminAlgorithm::EfsaReference: return nutrients::efsa_vitamins(in);
  }
  unknown_tag("vitamin", id);
}

double sugar_limit(SugarAlgorithm id, const SugarInput& in) {
  switch (id) {
    case SugarAlgorithm::WhoGuidelines:  return nutrients::who_sugar_limit(in);
    case SugarAlgorithm::WhoConditional: return nutrients::who_conditional_sugar_limit(in);
    case SugarAlgorithm::AhaAddedSugar:  return nutrients::aha_added_sugar_limit(in);
  }
  unknown_tag("sugar", id);
}

}  // namespace fuel::registry
