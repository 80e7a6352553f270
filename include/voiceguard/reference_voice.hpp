#ifndef VOICEGUARD_REFERENCE_VOICE_HPP
#define VOICEGUARD_REFERENCE_VOICE_HPP

#include <string>
#include <vector>

namespace voiceguard {

struct ReferenceVoice {
    std::string name;
    std::vector<float> embedding;
    std::string file_name;   // sample file inside the voices directory
    std::string registered;  // enrollment date, YYYY-MM-DD
};

} // namespace voiceguard

#endif // VOICEGUARD_REFERENCE_VOICE_HPP
