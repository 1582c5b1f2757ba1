// ==============================================================================
// glgname/detector.hpp - Набор детекторов GBM
// ==============================================================================
//
// Назначение:
// - Закрытое перечисление 14 детекторов (12 NaI + 2 BGO)
// - Преобразования индекс <-> короткий код <-> полное имя
// - Канонический порядок перечисления (n0..n9, na, nb, b0, b1)
//
// ==============================================================================

#ifndef GLGNAME_DETECTOR_HPP
#define GLGNAME_DETECTOR_HPP

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace glgname::detector {

// ----------------------------------------------------------------------------
// Detector
// ----------------------------------------------------------------------------

/// Значение перечисления совпадает с индексом детектора
enum class Detector {
    N0 = 0,
    N1,
    N2,
    N3,
    N4,
    N5,
    N6,
    N7,
    N8,
    N9,
    NA,
    NB,
    B0,
    B1
};

constexpr std::size_t DETECTOR_COUNT = 14;

/// Все детекторы в каноническом порядке
const std::array<Detector, DETECTOR_COUNT>& all_detectors();

// ----------------------------------------------------------------------------
// Нормализация
// ----------------------------------------------------------------------------

/// Детектор по индексу 0..13
std::optional<Detector> from_index(int index);

/// Детектор по короткому коду ("n0", "nb", "b1") или полному имени
/// ("NAI_00", "BGO_01"). Регистр не учитывается.
/// Строка "all" детектором не является -> nullopt.
std::optional<Detector> from_name(std::string_view name);

/// Короткий код в нижнем регистре: "n0".."nb", "b0", "b1"
std::string short_name(Detector det);

/// Полное имя: "NAI_00".."NAI_11", "BGO_00", "BGO_01"
std::string full_name(Detector det);

int index(Detector det);

bool is_nai(Detector det);
bool is_bgo(Detector det);

}  // namespace glgname::detector

#endif  // GLGNAME_DETECTOR_HPP
