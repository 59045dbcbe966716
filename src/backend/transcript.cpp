#include "backend/transcript.hpp"
#include "encoding/bfield_codec.hpp"

namespace zkverify {

Transcript::Transcript(const std::string& domain) {
    BFieldWriter writer;
    writer.put_string(domain);
    absorb(writer.elements());
}

void Transcript::absorb(const std::vector<BFieldElement>& data) {
    // Pad to multiple of RATE
    std::vector<BFieldElement> padded = data;
    padded.push_back(BFieldElement::one());  // Padding indicator
    while (padded.size() % Tip5::RATE != 0) {
        padded.push_back(BFieldElement::zero());
    }

    // Absorb in chunks of RATE
    for (size_t i = 0; i < padded.size(); i += Tip5::RATE) {
        for (size_t j = 0; j < Tip5::RATE; ++j) {
            sponge_.state[j] = padded[i + j];
        }
        sponge_.permutation();
    }
}

std::array<BFieldElement, Tip5::RATE> Transcript::squeeze() {
    std::array<BFieldElement, Tip5::RATE> result;
    for (size_t i = 0; i < Tip5::RATE; ++i) {
        result[i] = sponge_.state[i];
    }
    sponge_.permutation();
    return result;
}

Digest Transcript::challenge() {
    auto squeezed = squeeze();
    return Digest(squeezed[0], squeezed[1], squeezed[2], squeezed[3], squeezed[4]);
}

} // namespace zkverify
