// ==============================================================================
// test_detector_gtest.cpp - Тесты набора детекторов (GoogleTest)
// ==============================================================================
//
// Тесты: TST-DET-001..TST-DET-006
//
// ==============================================================================

#include "glgname/detector.hpp"

#include <gtest/gtest.h>
#include <set>
#include <string>

namespace glgname::detector::test {

// ==============================================================================
// TST-DET-001: Канонический порядок
// ==============================================================================

TEST(DetectorTest, TST_DET_001_AllDetectors_CanonicalOrder) {
    const auto& all = all_detectors();

    ASSERT_EQ(all.size(), 14u);
    EXPECT_EQ(all.front(), Detector::N0);
    EXPECT_EQ(all[9], Detector::N9);
    EXPECT_EQ(all[10], Detector::NA);
    EXPECT_EQ(all[11], Detector::NB);
    EXPECT_EQ(all[12], Detector::B0);
    EXPECT_EQ(all.back(), Detector::B1);

    for (size_t i = 0; i < all.size(); ++i) {
        EXPECT_EQ(index(all[i]), static_cast<int>(i));
    }
}

// ==============================================================================
// TST-DET-002: Индекс, короткий код и полное имя дают один детектор
// ==============================================================================

TEST(DetectorTest, TST_DET_002_IndexShortFull_Equivalent) {
    for (auto det : all_detectors()) {
        auto by_index = from_index(index(det));
        auto by_short = from_name(short_name(det));
        auto by_full = from_name(full_name(det));

        ASSERT_TRUE(by_index.has_value());
        ASSERT_TRUE(by_short.has_value());
        ASSERT_TRUE(by_full.has_value());
        EXPECT_EQ(*by_index, det);
        EXPECT_EQ(*by_short, det);
        EXPECT_EQ(*by_full, det);
    }
}

TEST(DetectorTest, TST_DET_002_Names_Table) {
    EXPECT_EQ(short_name(Detector::N0), "n0");
    EXPECT_EQ(full_name(Detector::N0), "NAI_00");
    EXPECT_EQ(short_name(Detector::NA), "na");
    EXPECT_EQ(full_name(Detector::NA), "NAI_10");
    EXPECT_EQ(short_name(Detector::NB), "nb");
    EXPECT_EQ(full_name(Detector::NB), "NAI_11");
    EXPECT_EQ(short_name(Detector::B0), "b0");
    EXPECT_EQ(full_name(Detector::B0), "BGO_00");
    EXPECT_EQ(full_name(Detector::B1), "BGO_01");
}

// ==============================================================================
// TST-DET-003: Регистр не учитывается
// ==============================================================================

TEST(DetectorTest, TST_DET_003_FromName_CaseInsensitive) {
    EXPECT_TRUE(from_name("NB") == Detector::NB);
    EXPECT_TRUE(from_name("nai_05") == Detector::N5);
    EXPECT_TRUE(from_name("Bgo_01") == Detector::B1);
}

// ==============================================================================
// TST-DET-004: Неизвестные значения
// ==============================================================================

TEST(DetectorTest, TST_DET_004_FromIndex_OutOfRange) {
    EXPECT_FALSE(from_index(-1).has_value());
    EXPECT_FALSE(from_index(14).has_value());
    EXPECT_FALSE(from_index(100).has_value());
}

TEST(DetectorTest, TST_DET_004_FromName_Unknown) {
    EXPECT_FALSE(from_name("nc").has_value());
    EXPECT_FALSE(from_name("b2").has_value());
    EXPECT_FALSE(from_name("NAI_12").has_value());
    EXPECT_FALSE(from_name("").has_value());
    // "all" - не детектор
    EXPECT_FALSE(from_name("all").has_value());
}

// ==============================================================================
// TST-DET-005: NaI / BGO
// ==============================================================================

TEST(DetectorTest, TST_DET_005_NaiBgo_Partition) {
    int nai = 0;
    int bgo = 0;
    for (auto det : all_detectors()) {
        EXPECT_NE(is_nai(det), is_bgo(det));
        nai += is_nai(det) ? 1 : 0;
        bgo += is_bgo(det) ? 1 : 0;
    }
    EXPECT_EQ(nai, 12);
    EXPECT_EQ(bgo, 2);
}

// ==============================================================================
// TST-DET-006: Короткие коды уникальны
// ==============================================================================

TEST(DetectorTest, TST_DET_006_ShortNames_Unique) {
    std::set<std::string> names;
    for (auto det : all_detectors()) {
        names.insert(short_name(det));
    }
    EXPECT_EQ(names.size(), DETECTOR_COUNT);
}

}  // namespace glgname::detector::test
