#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class SpotBacktesterException : public std::runtime_error {
    public:
        explicit SpotBacktesterException(const std::string& message)
            : std::runtime_error(message) {}

        explicit SpotBacktesterException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    class ConfigException : public SpotBacktesterException {
    public: using SpotBacktesterException::SpotBacktesterException; };

    class DataLoadException : public SpotBacktesterException {
    public: using SpotBacktesterException::SpotBacktesterException; };

    class ApiRequestException : public SpotBacktesterException {
    public: using SpotBacktesterException::SpotBacktesterException; };

    class RulesException : public SpotBacktesterException {
    public: using SpotBacktesterException::SpotBacktesterException; };

    class IndicatorCalculationException : public SpotBacktesterException {
    public: using SpotBacktesterException::SpotBacktesterException; };

    class StrategyException : public SpotBacktesterException {
    public: using SpotBacktesterException::SpotBacktesterException; };

    class BacktestException : public SpotBacktesterException {
    public: using SpotBacktesterException::SpotBacktesterException; };

    // Raised when a policy tries to sell more than the ledger holds.
    // This is a bug in the caller, never a market rejection.
    class InsufficientPositionException : public SpotBacktesterException {
    public: using SpotBacktesterException::SpotBacktesterException; };

} // namespace core
