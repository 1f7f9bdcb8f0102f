#ifndef NUMERICAL_TOOLKIT_HPP
#define NUMERICAL_TOOLKIT_HPP

#include <vector>

namespace SwingScanner {
namespace Core {

struct QuadraticFit {
    double a;   // Curvature
    double b;
    double c;

    QuadraticFit() : a(0.0), b(0.0), c(0.0) {}

    double vertex_x() const { return -b / (2.0 * a); }
};

/**
 * Least-squares fit of y = a*x^2 + b*x + c.
 * Throws std::runtime_error on fewer than 3 points, mismatched inputs or a singular system.
 */
QuadraticFit fit_quadratic(const std::vector<double>& x_values, const std::vector<double>& y_values);

/**
 * One-dimensional Gaussian kernel density estimate with Scott's bandwidth rule.
 * Throws std::runtime_error when the sample has fewer than 2 points or zero variance.
 */
class GaussianKde {
public:
    explicit GaussianKde(const std::vector<double>& sample_points);

    double get_bandwidth() const { return bandwidth; }
    double evaluate(double position) const;
    std::vector<double> evaluate(const std::vector<double>& positions) const;

private:
    std::vector<double> points;
    double bandwidth;
};

struct PeakCandidate {
    int index;
    double prominence;

    PeakCandidate() : index(0), prominence(0.0) {}
    PeakCandidate(int peak_index, double peak_prominence) : index(peak_index), prominence(peak_prominence) {}
};

std::vector<double> linspace(double start_value, double stop_value, int point_count);
double mean_value(const std::vector<double>& values);
double population_std(const std::vector<double>& values);
double sample_std(const std::vector<double>& values);

// Linear interpolation between closest ranks, percentile in [0, 100].
double percentile_linear(std::vector<double> values, double percentile);

// A point is an extremum when it beats every neighbour within order positions, indices clipped at the edges.
std::vector<int> find_relative_maxima(const std::vector<double>& values, int order, bool strict);
std::vector<int> find_relative_minima(const std::vector<double>& values, int order, bool strict);

// Local maxima (plateaus resolve to their middle) thinned to min_distance by height, then filtered by prominence.
std::vector<PeakCandidate> find_prominent_peaks(const std::vector<double>& values, int min_distance, double min_prominence);

} // namespace Core
} // namespace SwingScanner

#endif // NUMERICAL_TOOLKIT_HPP
