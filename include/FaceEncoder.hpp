#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Fixed-dimension face feature vector.
using FaceEncoding = std::vector<double>;
// Opaque image payload handed to the encoder.
using ImageData = std::vector<std::uint8_t>;

// Feature-extraction collaborator. Returns one encoding per detected face,
// in detector order (empty when no face is found). Throws on failure.
class FaceEncoder {
public:
    virtual ~FaceEncoder() = default;
    virtual std::vector<FaceEncoding> encode(const ImageData& image) const = 0;
};

// Encoder for output an external detector already produced: the "image" is a
// text file with one encoding per non-empty line, numbers separated by
// whitespace. Throws std::runtime_error on a non-numeric or non-finite value.
class PrecomputedEncoder : public FaceEncoder {
public:
    std::vector<FaceEncoding> encode(const ImageData& image) const override;
};
