#include "tokvec/types.hpp"
#include "tokvec/error.hpp"

namespace tokvec {

const char* precision_name(Precision p) noexcept {
    switch (p) {
        case Precision::Float16: return "float16";
        case Precision::Float32: return "float32";
        case Precision::Float64: return "float64";
    }
    return "float32";
}

Precision parse_precision(const std::string& name) {
    if (name == "float16" || name == "f16") return Precision::Float16;
    if (name == "float32" || name == "f32") return Precision::Float32;
    if (name == "float64" || name == "f64") return Precision::Float64;
    throw InvalidArgumentError("Unknown precision '" + name + "'", __func__,
                               "Use float16, float32 or float64");
}

void round_to_precision(Vector& values, Precision p) {
    if (p != Precision::Float16) return;  // float32 storage is exact, float64 widens
    for (Eigen::Index i = 0; i < values.size(); ++i) {
        values[i] = static_cast<float>(Eigen::half(values[i]));
    }
}

void round_to_precision(Matrix& values, Precision p) {
    if (p != Precision::Float16) return;
    values = values.unaryExpr([](float v) { return static_cast<float>(Eigen::half(v)); });
}

} // namespace tokvec
