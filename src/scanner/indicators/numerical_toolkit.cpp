#include "numerical_toolkit.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdlib>
#include <numeric>
#include <stdexcept>
#include <string>

namespace SwingScanner {
namespace Core {

namespace {
    constexpr double PIVOT_EPSILON = 1e-12;
    constexpr double INVERSE_SQRT_TWO_PI = 0.3989422804014327;

    std::vector<int> find_relative_extrema(const std::vector<double>& values, int order, bool strict, bool find_maxima) {
        std::vector<int> extrema_indices;
        int value_count = static_cast<int>(values.size());
        if (value_count == 0 || order < 1) {
            return extrema_indices;
        }

        for (int center_index = 0; center_index < value_count; ++center_index) {
            bool is_extremum = true;
            for (int shift = 1; shift <= order && is_extremum; ++shift) {
                int left_index = std::max(0, center_index - shift);
                int right_index = std::min(value_count - 1, center_index + shift);
                for (int neighbour_index : {left_index, right_index}) {
                    double center_value = values[center_index];
                    double neighbour_value = values[neighbour_index];
                    bool beats_neighbour;
                    if (find_maxima) {
                        beats_neighbour = strict ? center_value > neighbour_value : center_value >= neighbour_value;
                    } else {
                        beats_neighbour = strict ? center_value < neighbour_value : center_value <= neighbour_value;
                    }
                    if (!beats_neighbour) {
                        is_extremum = false;
                        break;
                    }
                }
            }
            if (is_extremum) {
                extrema_indices.push_back(center_index);
            }
        }
        return extrema_indices;
    }

    std::vector<int> find_local_maxima(const std::vector<double>& values) {
        std::vector<int> peak_indices;
        int value_count = static_cast<int>(values.size());
        int scan_index = 1;
        while (scan_index < value_count - 1) {
            if (values[scan_index - 1] < values[scan_index]) {
                int ahead_index = scan_index + 1;
                while (ahead_index < value_count - 1 && values[ahead_index] == values[scan_index]) {
                    ahead_index++;
                }
                if (values[ahead_index] < values[scan_index]) {
                    int plateau_end = ahead_index - 1;
                    peak_indices.push_back((scan_index + plateau_end) / 2);
                    scan_index = ahead_index;
                    continue;
                }
            }
            scan_index++;
        }
        return peak_indices;
    }

    double peak_prominence(const std::vector<double>& values, int peak_index) {
        double peak_value = values[peak_index];

        double left_minimum = peak_value;
        for (int left_index = peak_index; left_index >= 0 && values[left_index] <= peak_value; --left_index) {
            left_minimum = std::min(left_minimum, values[left_index]);
        }

        double right_minimum = peak_value;
        int value_count = static_cast<int>(values.size());
        for (int right_index = peak_index; right_index < value_count && values[right_index] <= peak_value; ++right_index) {
            right_minimum = std::min(right_minimum, values[right_index]);
        }

        return peak_value - std::max(left_minimum, right_minimum);
    }
}

QuadraticFit fit_quadratic(const std::vector<double>& x_values, const std::vector<double>& y_values) {
    if (x_values.size() != y_values.size()) {
        throw std::runtime_error("Quadratic fit input size mismatch: " + std::to_string(x_values.size()) +
                                 " x values, " + std::to_string(y_values.size()) + " y values");
    }
    if (x_values.size() < 3) {
        throw std::runtime_error("Quadratic fit needs at least 3 points, have " + std::to_string(x_values.size()));
    }

    // Normal equations: sums of x^0..x^4 and x^k * y
    std::array<double, 5> power_sums{};
    std::array<double, 3> moment_sums{};
    for (size_t point_index = 0; point_index < x_values.size(); ++point_index) {
        double x_value = x_values[point_index];
        double y_value = y_values[point_index];
        if (!std::isfinite(x_value) || !std::isfinite(y_value)) {
            throw std::runtime_error("Quadratic fit received a non-finite value");
        }
        double x_power = 1.0;
        for (size_t power = 0; power < power_sums.size(); ++power) {
            power_sums[power] += x_power;
            if (power < moment_sums.size()) {
                moment_sums[power] += x_power * y_value;
            }
            x_power *= x_value;
        }
    }

    // Unknowns ordered (a, b, c)
    double augmented_matrix[3][4] = {
        {power_sums[4], power_sums[3], power_sums[2], moment_sums[2]},
        {power_sums[3], power_sums[2], power_sums[1], moment_sums[1]},
        {power_sums[2], power_sums[1], power_sums[0], moment_sums[0]},
    };

    double matrix_scale = std::max(1.0, std::abs(power_sums[4]));
    for (int pivot_column = 0; pivot_column < 3; ++pivot_column) {
        int pivot_row = pivot_column;
        for (int candidate_row = pivot_column + 1; candidate_row < 3; ++candidate_row) {
            if (std::abs(augmented_matrix[candidate_row][pivot_column]) > std::abs(augmented_matrix[pivot_row][pivot_column])) {
                pivot_row = candidate_row;
            }
        }
        if (std::abs(augmented_matrix[pivot_row][pivot_column]) < PIVOT_EPSILON * matrix_scale) {
            throw std::runtime_error("Quadratic fit normal equations are singular");
        }
        if (pivot_row != pivot_column) {
            for (int column_index = 0; column_index < 4; ++column_index) {
                std::swap(augmented_matrix[pivot_row][column_index], augmented_matrix[pivot_column][column_index]);
            }
        }
        for (int eliminated_row = pivot_column + 1; eliminated_row < 3; ++eliminated_row) {
            double elimination_factor = augmented_matrix[eliminated_row][pivot_column] / augmented_matrix[pivot_column][pivot_column];
            for (int column_index = pivot_column; column_index < 4; ++column_index) {
                augmented_matrix[eliminated_row][column_index] -= elimination_factor * augmented_matrix[pivot_column][column_index];
            }
        }
    }

    double coefficients[3] = {0.0, 0.0, 0.0};
    for (int solve_row = 2; solve_row >= 0; --solve_row) {
        double remaining_value = augmented_matrix[solve_row][3];
        for (int known_column = solve_row + 1; known_column < 3; ++known_column) {
            remaining_value -= augmented_matrix[solve_row][known_column] * coefficients[known_column];
        }
        coefficients[solve_row] = remaining_value / augmented_matrix[solve_row][solve_row];
    }

    QuadraticFit quadratic_fit;
    quadratic_fit.a = coefficients[0];
    quadratic_fit.b = coefficients[1];
    quadratic_fit.c = coefficients[2];
    return quadratic_fit;
}

GaussianKde::GaussianKde(const std::vector<double>& sample_points) : points(sample_points), bandwidth(0.0) {
    if (points.size() < 2) {
        throw std::runtime_error("Kernel density needs at least 2 points, have " + std::to_string(points.size()));
    }
    double spread = sample_std(points);
    if (!std::isfinite(spread) || spread <= 0.0) {
        throw std::runtime_error("Kernel density sample has zero variance");
    }
    // Scott's rule for one dimension
    double scott_factor = std::pow(static_cast<double>(points.size()), -0.2);
    bandwidth = spread * scott_factor;
}

double GaussianKde::evaluate(double position) const {
    double density_sum = 0.0;
    for (double sample_point : points) {
        double standardized_distance = (position - sample_point) / bandwidth;
        density_sum += std::exp(-0.5 * standardized_distance * standardized_distance);
    }
    return density_sum * INVERSE_SQRT_TWO_PI / (bandwidth * static_cast<double>(points.size()));
}

std::vector<double> GaussianKde::evaluate(const std::vector<double>& positions) const {
    std::vector<double> density_values;
    density_values.reserve(positions.size());
    for (double position : positions) {
        density_values.push_back(evaluate(position));
    }
    return density_values;
}

std::vector<double> linspace(double start_value, double stop_value, int point_count) {
    std::vector<double> grid_values;
    if (point_count <= 0) {
        return grid_values;
    }
    if (point_count == 1) {
        grid_values.push_back(start_value);
        return grid_values;
    }
    grid_values.reserve(static_cast<size_t>(point_count));
    double step_size = (stop_value - start_value) / static_cast<double>(point_count - 1);
    for (int point_index = 0; point_index < point_count - 1; ++point_index) {
        grid_values.push_back(start_value + step_size * static_cast<double>(point_index));
    }
    grid_values.push_back(stop_value);
    return grid_values;
}

double mean_value(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double population_std(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double average = mean_value(values);
    double squared_sum = 0.0;
    for (double value : values) {
        squared_sum += (value - average) * (value - average);
    }
    return std::sqrt(squared_sum / static_cast<double>(values.size()));
}

double sample_std(const std::vector<double>& values) {
    if (values.size() < 2) {
        return 0.0;
    }
    double average = mean_value(values);
    double squared_sum = 0.0;
    for (double value : values) {
        squared_sum += (value - average) * (value - average);
    }
    return std::sqrt(squared_sum / static_cast<double>(values.size() - 1));
}

double percentile_linear(std::vector<double> values, double percentile) {
    if (values.empty()) {
        throw std::runtime_error("Percentile of an empty sample");
    }
    std::sort(values.begin(), values.end());
    double clamped_percentile = std::min(100.0, std::max(0.0, percentile));
    double fractional_rank = clamped_percentile / 100.0 * static_cast<double>(values.size() - 1);
    size_t lower_rank = static_cast<size_t>(std::floor(fractional_rank));
    size_t upper_rank = std::min(lower_rank + 1, values.size() - 1);
    double interpolation_weight = fractional_rank - static_cast<double>(lower_rank);
    return values[lower_rank] + (values[upper_rank] - values[lower_rank]) * interpolation_weight;
}

std::vector<int> find_relative_maxima(const std::vector<double>& values, int order, bool strict) {
    return find_relative_extrema(values, order, strict, true);
}

std::vector<int> find_relative_minima(const std::vector<double>& values, int order, bool strict) {
    return find_relative_extrema(values, order, strict, false);
}

std::vector<PeakCandidate> find_prominent_peaks(const std::vector<double>& values, int min_distance, double min_prominence) {
    std::vector<int> local_maxima = find_local_maxima(values);

    // Keep the tallest peaks first and drop neighbours closer than min_distance
    std::vector<bool> keep_peak(local_maxima.size(), true);
    if (min_distance > 1 && local_maxima.size() > 1) {
        std::vector<size_t> priority_order(local_maxima.size());
        std::iota(priority_order.begin(), priority_order.end(), 0);
        std::stable_sort(priority_order.begin(), priority_order.end(), [&](size_t left, size_t right) {
            return values[local_maxima[left]] > values[local_maxima[right]];
        });
        for (size_t priority_index : priority_order) {
            if (!keep_peak[priority_index]) {
                continue;
            }
            for (size_t other_index = 0; other_index < local_maxima.size(); ++other_index) {
                if (other_index == priority_index || !keep_peak[other_index]) {
                    continue;
                }
                if (std::abs(local_maxima[other_index] - local_maxima[priority_index]) < min_distance) {
                    keep_peak[other_index] = false;
                }
            }
        }
    }

    std::vector<PeakCandidate> prominent_peaks;
    for (size_t peak_position = 0; peak_position < local_maxima.size(); ++peak_position) {
        if (!keep_peak[peak_position]) {
            continue;
        }
        double prominence = peak_prominence(values, local_maxima[peak_position]);
        if (prominence >= min_prominence) {
            prominent_peaks.emplace_back(local_maxima[peak_position], prominence);
        }
    }
    return prominent_peaks;
}

} // namespace Core
} // namespace SwingScanner
