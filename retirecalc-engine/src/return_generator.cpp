#include "return_generator.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace retirecalc {

namespace {
constexpr double MIN_ANNUAL_RETURN = -0.95;
}

double cagr2aagr(double cagr, double volatility) {
    return cagr + volatility * volatility / 2.0;
}

double aagr2cagr(double aagr, double volatility) {
    return aagr - volatility * volatility / 2.0;
}

CorrelationMatrix cholesky(const CorrelationMatrix& matrix) {
    CorrelationMatrix lower{};
    for (size_t i = 0; i < NUM_ASSET_CLASSES; ++i) {
        for (size_t j = 0; j <= i; ++j) {
            double sum = matrix[i][j];
            for (size_t k = 0; k < j; ++k) {
                sum -= lower[i][k] * lower[j][k];
            }
            if (i == j) {
                if (sum <= 0.0) {
                    throw InvalidParameterError("market.correlation",
                                                "matrix is not positive definite");
                }
                lower[i][i] = std::sqrt(sum);
            } else {
                lower[i][j] = sum / lower[j][j];
            }
        }
    }
    return lower;
}

double inverse_normal_cdf(double p) {
    if (p <= 0.0 || p >= 1.0) {
        throw std::invalid_argument("inverse_normal_cdf requires p in (0, 1)");
    }

    static const double a[4] = {2.50662823884, -18.61500062529, 41.39119773534, -25.44106049637};
    static const double b[4] = {-8.47351093090, 23.08336743743, -21.06224101826, 3.13082909833};
    static const double c[9] = {0.3374754822726147, 0.9761690190917186, 0.1607979714918209,
                                0.0276438810333863, 0.0038405729373609, 0.0003951896511919,
                                0.0000321767881768, 0.0000002888167364, 0.0000003960315187};

    double y = p - 0.5;
    if (std::fabs(y) < 0.42) {
        double r = y * y;
        return y * (((a[3] * r + a[2]) * r + a[1]) * r + a[0]) /
               ((((b[3] * r + b[2]) * r + b[1]) * r + b[0]) * r + 1.0);
    }

    // Tail region
    double r = (y > 0.0) ? 1.0 - p : p;
    r = std::log(-std::log(r));
    double x = c[0] + r * (c[1] + r * (c[2] + r * (c[3] + r * (c[4] + r * (c[5] +
               r * (c[6] + r * (c[7] + r * c[8])))))));
    return (y < 0.0) ? -x : x;
}

std::string regime_to_string(MarketRegime regime) {
    return regime == MarketRegime::Stress ? "stress" : "normal";
}

// ============================================================================
// ReturnDraw Implementation
// ============================================================================

ReturnDraw::ReturnDraw()
    : returns{0.0, 0.0, 0.0}, regime(MarketRegime::Normal) {}

ReturnDraw::ReturnDraw(const AssetVector& r, MarketRegime reg)
    : returns(r), regime(reg) {}

double ReturnDraw::portfolio(const AssetVector& weights) const {
    double total = 0.0;
    for (size_t k = 0; k < NUM_ASSET_CLASSES; ++k) {
        total += weights[k] * returns[k];
    }
    return total;
}

// ============================================================================
// ReturnGenerator Implementation
// ============================================================================

ReturnGenerator::ReturnGenerator(const MarketAssumptions& market,
                                 const SimulationSettings& settings,
                                 const RngContext& rng,
                                 size_t iterations)
    : chol_(cholesky(market.correlation)),
      variance_reduction_(settings.variance_reduction),
      regime_(settings.regime),
      rng_(rng),
      distribution_(market.distribution),
      dof_(market.degrees_of_freedom),
      units_(0),
      lhs_years_(0) {
    for (size_t k = 0; k < NUM_ASSET_CLASSES; ++k) {
        vols_[k] = market.classes[k].volatility;
        means_[k] = cagr2aagr(market.classes[k].cagr, vols_[k]);
    }

    units_ = variance_reduction_.antithetic ? (iterations + 1) / 2 : iterations;
    if (variance_reduction_.latin_hypercube && units_ > 0) {
        lhs_years_ = static_cast<size_t>(variance_reduction_.lhs_years);
        build_strata();
    }
}

size_t ReturnGenerator::sampling_unit(size_t scenario) const {
    return variance_reduction_.antithetic ? scenario / 2 : scenario;
}

bool ReturnGenerator::is_mirrored(size_t scenario) const {
    return variance_reduction_.antithetic && (scenario % 2 == 1);
}

void ReturnGenerator::build_strata() {
    strata_.assign(units_ * lhs_years_ * NUM_ASSET_CLASSES, 0.0);
    std::vector<size_t> permutation(units_);
    const double n = static_cast<double>(units_);

    // Each (year, asset class) dimension gets its own shuffled strata
    for (size_t year = 0; year < lhs_years_; ++year) {
        for (size_t k = 0; k < NUM_ASSET_CLASSES; ++k) {
            size_t dimension = year * NUM_ASSET_CLASSES + k;
            RandomStream stream = rng_.stream(dimension, StreamId::Stratification);

            std::iota(permutation.begin(), permutation.end(), size_t(0));
            for (size_t i = units_ - 1; i > 0; --i) {
                size_t j = static_cast<size_t>(stream.next_u64() % (i + 1));
                std::swap(permutation[i], permutation[j]);
            }

            for (size_t unit = 0; unit < units_; ++unit) {
                double u = (static_cast<double>(permutation[unit]) + stream.uniform()) / n;
                u = std::min(std::max(u, 1e-12), 1.0 - 1e-12);
                strata_[(unit * lhs_years_ + year) * NUM_ASSET_CLASSES + k] = inverse_normal_cdf(u);
            }
        }
    }
}

std::vector<ReturnDraw> ReturnGenerator::generate(size_t scenario, size_t years) const {
    std::vector<ReturnDraw> path;
    path.reserve(years);

    const size_t unit = sampling_unit(scenario);
    const double sign = is_mirrored(scenario) ? -1.0 : 1.0;
    RandomStream normals = rng_.stream(unit, StreamId::Returns);
    RandomStream regime_stream = rng_.stream(unit, StreamId::Regime);
    RandomStream mixing_stream = rng_.stream(unit, StreamId::TailMixing);
    const bool fat_tails = distribution_ == ReturnDistribution::StudentT;

    MarketRegime regime = MarketRegime::Normal;

    for (size_t year = 0; year < years; ++year) {
        // Independent standard normals, stratified for the early years
        AssetVector z;
        for (size_t k = 0; k < NUM_ASSET_CLASSES; ++k) {
            z[k] = normals.normal();
        }
        if (year < lhs_years_) {
            for (size_t k = 0; k < NUM_ASSET_CLASSES; ++k) {
                z[k] = strata_[(unit * lhs_years_ + year) * NUM_ASSET_CLASSES + k];
            }
        }

        if (regime_.enabled) {
            double u = regime_stream.uniform();
            if (regime == MarketRegime::Normal && u < regime_.normal_to_stress) {
                regime = MarketRegime::Stress;
            } else if (regime == MarketRegime::Stress && u < regime_.stress_to_normal) {
                regime = MarketRegime::Normal;
            }
        }

        // sqrt((nu - 2) / chi2_nu) turns a unit normal into a unit-variance t
        double tail_scale = 1.0;
        if (fat_tails) {
            double chi2 = 0.0;
            for (int d = 0; d < dof_; ++d) {
                double g = mixing_stream.normal();
                chi2 += g * g;
            }
            tail_scale = std::sqrt(static_cast<double>(dof_ - 2) / std::max(chi2, 1e-12));
        }

        AssetVector returns;
        for (size_t i = 0; i < NUM_ASSET_CLASSES; ++i) {
            double correlated = 0.0;
            for (size_t k = 0; k <= i; ++k) {
                correlated += chol_[i][k] * z[k];
            }
            correlated *= sign * tail_scale;

            double mean = means_[i];
            double vol = vols_[i];
            if (regime == MarketRegime::Stress) {
                mean += regime_.stress_mean_shift[i];
                vol *= regime_.stress_volatility_multiplier;
            }
            returns[i] = std::max(MIN_ANNUAL_RETURN, mean + vol * correlated);
        }

        path.emplace_back(returns, regime);
    }

    return path;
}

double ReturnGenerator::expected_portfolio_return(const AssetVector& weights) const {
    double total = 0.0;
    for (size_t k = 0; k < NUM_ASSET_CLASSES; ++k) {
        total += weights[k] * means_[k];
    }
    return total;
}

} // namespace retirecalc
