#include "NoiseSource.hh"

namespace TippingSimulation {

MersenneNoiseSource::MersenneNoiseSource(unsigned long long seed)
    : m_engine(static_cast<std::mt19937::result_type>(seed))
    , m_normal(0.0, 1.0)
{
}

double MersenneNoiseSource::standardNormal() {
    return m_normal(m_engine);
}

void MersenneNoiseSource::setSeed(unsigned long long seed) {
    m_engine.seed(static_cast<std::mt19937::result_type>(seed));
    m_normal.reset();
}

} // namespace TippingSimulation
