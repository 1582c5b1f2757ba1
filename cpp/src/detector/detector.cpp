// ==============================================================================
// detector.cpp - Набор детекторов GBM
// ==============================================================================

#include "glgname/detector.hpp"

#include <cctype>

namespace glgname::detector {

namespace {

struct DetectorInfo {
    Detector det;
    const char* short_name;
    const char* full_name;
};

// Канонический порядок: 12 NaI, затем 2 BGO
constexpr DetectorInfo DETECTORS[DETECTOR_COUNT] = {
    {Detector::N0, "n0", "NAI_00"}, {Detector::N1, "n1", "NAI_01"},
    {Detector::N2, "n2", "NAI_02"}, {Detector::N3, "n3", "NAI_03"},
    {Detector::N4, "n4", "NAI_04"}, {Detector::N5, "n5", "NAI_05"},
    {Detector::N6, "n6", "NAI_06"}, {Detector::N7, "n7", "NAI_07"},
    {Detector::N8, "n8", "NAI_08"}, {Detector::N9, "n9", "NAI_09"},
    {Detector::NA, "na", "NAI_10"}, {Detector::NB, "nb", "NAI_11"},
    {Detector::B0, "b0", "BGO_00"}, {Detector::B1, "b1", "BGO_01"},
};

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace

const std::array<Detector, DETECTOR_COUNT>& all_detectors() {
    static const std::array<Detector, DETECTOR_COUNT> detectors = [] {
        std::array<Detector, DETECTOR_COUNT> result{};
        for (size_t i = 0; i < DETECTOR_COUNT; ++i) {
            result[i] = DETECTORS[i].det;
        }
        return result;
    }();
    return detectors;
}

std::optional<Detector> from_index(int index) {
    if (index < 0 || index >= static_cast<int>(DETECTOR_COUNT)) {
        return std::nullopt;
    }
    return DETECTORS[index].det;
}

std::optional<Detector> from_name(std::string_view name) {
    for (const auto& info : DETECTORS) {
        if (iequals(name, info.short_name) || iequals(name, info.full_name)) {
            return info.det;
        }
    }
    return std::nullopt;
}

std::string short_name(Detector det) {
    return DETECTORS[index(det)].short_name;
}

std::string full_name(Detector det) {
    return DETECTORS[index(det)].full_name;
}

int index(Detector det) {
    return static_cast<int>(det);
}

bool is_nai(Detector det) {
    return index(det) <= index(Detector::NB);
}

bool is_bgo(Detector det) {
    return det == Detector::B0 || det == Detector::B1;
}

}  // namespace glgname::detector
