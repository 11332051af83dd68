#ifndef RETIRECALC_RETURN_GENERATOR_HPP
#define RETIRECALC_RETURN_GENERATOR_HPP

#include "params.hpp"
#include "rng.hpp"
#include <string>
#include <vector>

namespace retirecalc {

// Arithmetic mean that compounds to the requested CAGR at the given volatility
double cagr2aagr(double cagr, double volatility);

// Inverse of cagr2aagr
double aagr2cagr(double aagr, double volatility);

// Lower-triangular L with L * L^T = matrix.
// Throws InvalidParameterError("market.correlation") if not positive definite.
CorrelationMatrix cholesky(const CorrelationMatrix& matrix);

// Inverse standard normal CDF (Beasley-Springer-Moro), p in (0, 1)
double inverse_normal_cdf(double p);

enum class MarketRegime : uint8_t {
    Normal = 0,
    Stress = 1
};

std::string regime_to_string(MarketRegime regime);

// One year's return per asset class for one scenario
struct ReturnDraw {
    AssetVector returns;
    MarketRegime regime;

    ReturnDraw();
    ReturnDraw(const AssetVector& r, MarketRegime reg);

    double stocks() const { return returns[0]; }
    double bonds() const { return returns[1]; }
    double cash() const { return returns[2]; }

    // Weighted return of a portfolio
    double portfolio(const AssetVector& weights) const;
};

// Produces return paths for every scenario of a run.
//
// Antithetic pairs: scenarios 2k and 2k+1 share their normal draws, the odd
// scenario mirrors them. Latin-hypercube strata are precomputed for the
// first lhs_years years, one stratum per sampling unit (scenario or pair).
// Regime paths are shared by a pair so the mirror stays in the same market.
//
// Student-t mode divides each year's correlated normals by one shared
// chi-square mixing draw, so every asset class sees the same fat-tailed
// year. The mixing draw also follows the sampling unit, and the result is
// rescaled to unit variance so volatilities keep their meaning.
class ReturnGenerator {
public:
    ReturnGenerator(const MarketAssumptions& market,
                    const SimulationSettings& settings,
                    const RngContext& rng,
                    size_t iterations);

    std::vector<ReturnDraw> generate(size_t scenario, size_t years) const;

    // Arithmetic means after the CAGR conversion
    const AssetVector& arithmetic_means() const { return means_; }
    const AssetVector& volatilities() const { return vols_; }

    // Expected one-year return of a static portfolio in the normal regime
    double expected_portfolio_return(const AssetVector& weights) const;

    // Index of the sampling unit that drives a scenario's normals
    size_t sampling_unit(size_t scenario) const;
    bool is_mirrored(size_t scenario) const;

private:
    AssetVector means_;
    AssetVector vols_;
    CorrelationMatrix chol_;
    VarianceReduction variance_reduction_;
    RegimeSwitching regime_;
    RngContext rng_;
    ReturnDistribution distribution_;
    int dof_;
    size_t units_;
    size_t lhs_years_;
    // strata_[(unit * lhs_years_ + year) * NUM_ASSET_CLASSES + k]
    std::vector<double> strata_;

    void build_strata();
};

} // namespace retirecalc

#endif // RETIRECALC_RETURN_GENERATOR_HPP
