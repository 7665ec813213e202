#include <complex>
#include <cstdlib>

#include <fmt/core.h>

#include <scuq/Context.hpp>
#include <scuq/Quantity.hpp>
#include <scuq/formatter/QuantityFormatter.hpp>
#include <scuq/si.hpp>

int main() {
    using namespace scuq;

    try {
        {
            // uncertain input -> quantity -> model, evaluated in a Context
            const auto    value  = UncertainValue<double>::input(1.0, 0.2);
            const auto    length = Quantity<double>{value, si::metre};
            const auto    model  = math::sqrt(length);
            const Context context;
            fmt::print("input value:   {} -> u = {}\n", value, context.standardUncertainty(value));
            const auto uLength = context.uncertainty(length);
            const auto uModel  = context.uncertainty(model);
            fmt::print("input length:  {} -> u = {} {}\n", length, uLength.nominal(), uLength.unit());
            fmt::print("sqrt(length):  {} -> u = {} {}\n", model, uModel.nominal(), uModel.unit());
        }

        {
            // unit conversion keeps the uncertainty component
            const auto voltage   = Quantity<double>::uncertain(2.0, 0.01, si::volt);
            const auto millivolt = voltage.convertTo(si::volt.scaled(si::milli));
            fmt::print("{} = {} (correlation {})\n", voltage, millivolt, voltage.correlation(millivolt));
        }

        {
            // two readings of the same calibrated instrument
            const Component gain   = ComponentRegistry::fromStandardUncertainty(0.02);
            const auto      first  = Quantity<double>{UncertainValue<double>::fromComponent(1.0, gain, 1.0), si::volt};
            const auto      second = Quantity<double>{UncertainValue<double>::fromComponent(3.0, gain, 3.0), si::volt};
            fmt::print("difference of two readings: {:.3f}\n", second - first);
        }

        {
            // complex phasor: magnitude and phase with uncertainty
            const auto phasor = Quantity<std::complex<double>>::uncertain({3.0, 4.0}, 0.1, 0.1, si::volt);
            fmt::print("phasor {:.2f}: |z| = {:.3f}, arg(z) = {:.4f}\n", phasor, math::magnitude(phasor), math::phase(phasor));
        }

        {
            const auto length = Quantity<double>::uncertain(10.0, 0.2, si::metre);
            const auto time   = Quantity<double>::uncertain(2.0, 0.1, si::second);
            fmt::print("speed: {:.3f}\n", (length / time).convertTo(si::kilometre / si::hour));
            try {
                fmt::print("{}\n", length + time);
            } catch (const IncompatibleUnitsError& e) {
                fmt::print("length + time: {}\n", e);
            }
        }
    } catch (const scuq::exception& e) {
        fmt::print("caught: {}\n", e);
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
