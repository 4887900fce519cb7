#include "sma_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <ta_libc.h>            // TA-Lib C API
#include <vector>

namespace indicators {

SmaIndicator::SmaIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
        throw core::IndicatorCalculationException(fmt::format("SMA period must be positive, got {}", period_));
    }

    lookback_ = TA_MA_Lookback(period_, TA_MAType_SMA);
    if (lookback_ < 0) {
        throw core::IndicatorCalculationException(
            fmt::format("TA_MA_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("SMA({})", period_);
    core::logging::getLogger()->debug("SmaIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string SmaIndicator::getName() const {
    return name_;
}

int SmaIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& SmaIndicator::getResult() const {
    return results_;
}

void SmaIndicator::calculate(const core::TimeSeries<double>& input) {
    auto logger = core::logging::getLogger();
    results_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->trace("Input size ({}) <= lookback ({}) for {}. No results generated.",
                      input.size(), lookback_, name_);
        return;
    }

    // TA-Lib output size = input size - lookback
    int output_size = static_cast<int>(input.size()) - lookback_;
    results_.resize(output_size);

    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_MA(
        0,                                   // startIdx
        static_cast<int>(input.size()) - 1,  // endIdx
        input.data(),
        period_,
        TA_MAType_SMA,
        &out_begin_idx,
        &out_nb_element,
        results_.data()
    );

    if (ret_code != TA_SUCCESS) {
        results_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA_MA failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }

    if (out_begin_idx != lookback_) {
        logger->warn("TA_MA out_begin_idx ({}) does not match lookback ({}) for {}.",
                     out_begin_idx, lookback_, name_);
    }
    if (out_nb_element != output_size) {
        results_.resize(out_nb_element);
    }

    logger->trace("Calculated {} results for {}", results_.size(), name_);
}

} // namespace indicators
