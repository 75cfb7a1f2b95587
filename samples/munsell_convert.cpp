/**
 * @file munsell_convert.cpp
 * @brief Convert hex colors to Munsell notation and color names
 */

#include <MunsellSpace/MunsellSpace.h>

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace MunsellSpace;
using namespace MunsellSpace::Pipeline;

int main(int argc, char* argv[]) {
    std::vector<std::string> hexColors;
    ConverterConfig config;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--profile" && i + 1 < argc) {
                config.SetProfile(Color::ParseRgbProfile(argv[++i]));
            } else if (arg == "--strategy" && i + 1 < argc) {
                config.SetStrategy(Renotation::ParseInversionMethod(argv[++i]));
            } else if (arg == "--method1") {
                config.SetBoundaryPolicy(Classify::BoundaryPolicy::Method1);
            } else {
                hexColors.push_back(arg);
            }
        }
        if (hexColors.empty()) {
            hexColors = {"#BE0032", "#F4C2C2", "#008080", "#808080"};
        }

        std::cout << "=== MunsellSpace " << GetVersion() << " ===\n";
        std::cout << "Profile: " << Color::ToString(config.profile)
                  << ", strategy: " << Renotation::ToString(config.strategy)
                  << ", boundary: " << Classify::ToString(config.boundaryPolicy) << "\n\n";

        MunsellConverter converter(config);
        const auto& classifier = Classify::IsccNbsClassifier::Default();

        for (const auto& hex : hexColors) {
            auto result = converter.ConvertHex(hex);
            auto match = classifier.Classify(result.color, config.boundaryPolicy);

            std::cout << std::left << std::setw(10) << hex
                      << std::setw(20) << result.color.ToString(2)
                      << std::setw(6) << match.colorNumber
                      << match.descriptor;
            if (!result.converged) {
                std::cout << "  (not converged, residual " << std::scientific
                          << std::setprecision(2) << result.residual << std::defaultfloat << ")";
            }
            std::cout << "\n";
        }
    } catch (const IOException& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << "Renotation data: " << Renotation::RenotationTable::DefaultPath() << std::endl;
        return 1;
    } catch (const Exception& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << "Usage: " << argv[0]
                  << " [--profile sRGB] [--strategy bracketing|newton] [--method1] [#RRGGBB ...]"
                  << std::endl;
        return 1;
    }

    return 0;
}
