#pragma once
/*
================================================================================
Fragment 2.1 — Algorithms: Identifiers (one tagged enum per category)
FILE: cpp/engine/algorithms/algorithm_ids.hpp

Purpose:
  - Each category is a closed sum type. The single dispatch site for a
    category (registry.cpp) switches over every enumerator without a default,
    so adding an algorithm is a compile-checked local change:
        1) add the enumerator here,
        2) add its name row in algorithm_ids.cpp,
        3) add its case in registry.cpp.
  - Identifiers coming from preferences are parsed here. An identifier that
    is not registered throws Error{kUnknownAlgorithm}.

Notes:
  - Parsing accepts the snake_case key ("mifflin_st_jeor") and the display
    label used by stored preferences ("Mifflin-St Jeor"), case-insensitive.
================================================================================
*/

#include <string_view>

namespace fuel {

enum class BmrAlgorithm : int {
  MifflinStJeor = 0,          // reference / default
  RevisedHarrisBenedict = 1,
  KatchMcArdle = 2,           // needs body fat
};

enum class BodyFatAlgorithm : int {
  UsNavy = 0,                 // reference / default
  Bmi = 1,
};

enum class FatBreakdownAlgorithm : int {
  AhaGuidelines = 0,          // reference / default
};

enum class MineralAlgorithm : int {
  RdaStandard = 0,            // reference / default
  DashDiet = 1,
};

enum class VitaminAlgorithm : int {
  RdaStandard = 0,            // reference / default
  EfsaReference = 1,
};

enum class SugarAlgorithm : int {
  WhoGuidelines = 0,          // reference / default (10 % of energy)
  WhoConditional = 1,         // 5 % of energy
  AhaAddedSugar = 2,
};

const char* to_string(BmrAlgorithm a) noexcept;
const char* to_string(BodyFatAlgorithm a) noexcept;
const char* to_string(FatBreakdownAlgorithm a) noexcept;
const char* to_string(MineralAlgorithm a) noexcept;
const char* to_string(VitaminAlgorithm a) noexcept;
const char* to_string(SugarAlgorithm a) noexcept;

const char* display_label(BmrAlgorithm a) noexcept;
const char* display_label(BodyFatAlgorithm a) noexcept;

BmrAlgorithm parse_bmr_algorithm(std::string_view s);
BodyFatAlgorithm parse_body_fat_algorithm(std::string_view s);
FatBreakdownAlgorithm parse_fat_breakdown_algorithm(std::string_view s);
MineralAlgorithm parse_mineral_algorithm(std::string_view s);
VitaminAlgorithm parse_vitamin_algorithm(std::string_view s);
SugarAlgorithm parse_sugar_algorithm(std::string_view s);

// True for BMR formulas that take lean body mass as input.
bool bmr_uses_body_fat(BmrAlgorithm a) noexcept;

}  // namespace fuel
