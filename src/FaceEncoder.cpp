#include "FaceEncoder.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

std::vector<FaceEncoding> PrecomputedEncoder::encode(const ImageData& image) const {
    std::istringstream in(std::string(image.begin(), image.end()));
    std::vector<FaceEncoding> faces;

    std::string line;
    std::size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        std::istringstream fields(line);
        FaceEncoding enc;
        std::string tok;
        while (fields >> tok) {
            std::size_t used = 0;
            double v = 0.0;
            try {
                v = std::stod(tok, &used);
            } catch (const std::logic_error&) {
                used = 0;   // invalid_argument / out_of_range
            }
            if (used != tok.size() || !std::isfinite(v)) {
                throw std::runtime_error("encoding line " + std::to_string(lineNo)
                                         + ": bad value '" + tok + "'");
            }
            enc.push_back(v);
        }
        if (!enc.empty()) faces.push_back(std::move(enc));
    }
    return faces;
}
