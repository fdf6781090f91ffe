/**
 * @file chord_normalizer.cpp
 * @brief Chord label parsing, quality aliasing and memoization.
 */

#include "core/chord_normalizer.h"

#include <algorithm>
#include <cctype>

#include "core/logging.h"

namespace chordgrid {

namespace {

// UTF-8 accidentals used by some detectors and by hand-edited labels.
constexpr std::string_view kSharpSign = "\xE2\x99\xAF";  // U+266F
constexpr std::string_view kFlatSign = "\xE2\x99\xAD";   // U+266D

// Letter pitch classes, A-G.
constexpr int kLetterPitch[] = {9, 11, 0, 2, 4, 5, 7};

struct SuffixAlias {
  const char* alias;
  const char* canonical;
};

// Case-sensitive: "M7" is major seventh, "m7" is minor seventh.
// Harte shorthands ("maj", "min7", "hdim7") share the table with common spellings.
constexpr SuffixAlias kSuffixAliases[] = {
    // Triads
    {"", ""},
    {"maj", ""},
    {"M", ""},
    {"major", ""},
    {"m", "m"},
    {"min", "m"},
    {"minor", "m"},
    {"-", "m"},
    {"dim", "dim"},
    {"\xC2\xB0", "dim"},  // degree sign
    {"o", "dim"},
    {"aug", "aug"},
    {"+", "aug"},
    {"sus4", "sus4"},
    {"sus", "sus4"},
    {"sus2", "sus2"},
    {"5", "5"},
    // Sevenths
    {"7", "7"},
    {"dom7", "7"},
    {"maj7", "maj7"},
    {"M7", "maj7"},
    {"ma7", "maj7"},
    {"j7", "maj7"},
    {"^7", "maj7"},
    {"\xCE\x94", "maj7"},   // delta
    {"\xCE\x94" "7", "maj7"},
    {"m7", "m7"},
    {"min7", "m7"},
    {"mi7", "m7"},
    {"-7", "m7"},
    {"mmaj7", "mmaj7"},
    {"mM7", "mmaj7"},
    {"mMaj7", "mmaj7"},
    {"minmaj7", "mmaj7"},
    {"m(maj7)", "mmaj7"},
    {"min(maj7)", "mmaj7"},
    {"-maj7", "mmaj7"},
    {"dim7", "dim7"},
    {"\xC2\xB0" "7", "dim7"},
    {"o7", "dim7"},
    {"hdim7", "m7b5"},
    {"hdim", "m7b5"},
    {"m7b5", "m7b5"},
    {"m7-5", "m7b5"},
    {"min7b5", "m7b5"},
    {"-7b5", "m7b5"},
    {"\xC3\xB8", "m7b5"},  // o-slash
    {"\xC3\xB8" "7", "m7b5"},
    {"aug7", "aug7"},
    {"+7", "aug7"},
    {"7#5", "aug7"},
    {"7+5", "aug7"},
    {"7sus4", "7sus4"},
    {"7sus", "7sus4"},
    // Sixths and extensions
    {"6", "6"},
    {"maj6", "6"},
    {"M6", "6"},
    {"m6", "m6"},
    {"min6", "m6"},
    {"-6", "m6"},
    {"9", "9"},
    {"dom9", "9"},
    {"maj9", "maj9"},
    {"M9", "maj9"},
    {"m9", "m9"},
    {"min9", "m9"},
    {"-9", "m9"},
    {"add9", "add9"},
    {"add2", "add9"},
    {"11", "11"},
    {"m11", "m11"},
    {"min11", "m11"},
    {"13", "13"},
    {"maj13", "maj13"},
    {"m13", "m13"},
    {"min13", "m13"},
};

const char* lookupSuffix(const std::string& suffix) {
  for (const auto& entry : kSuffixAliases) {
    if (suffix == entry.alias) return entry.canonical;
  }
  return nullptr;
}

std::string toLower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

// Spelled-out words are accepted in any case ("Maj7", "MIN"). Single-letter
// forms stay case-sensitive because "M" and "m" differ in quality.
const char* lookupSuffixFolded(const std::string& suffix) {
  if (suffix.size() < 3) return nullptr;
  std::string lower = toLower(suffix);
  static constexpr std::string_view kWords[] = {"maj", "min", "dim", "aug", "sus", "add", "hdi",
                                                "dom"};
  bool is_word = false;
  for (auto word : kWords) {
    if (lower.compare(0, word.size(), word) == 0) {
      is_word = true;
      break;
    }
  }
  return is_word ? lookupSuffix(lower) : nullptr;
}

std::string_view trim(std::string_view s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
  return s.substr(begin, end - begin);
}

// Consume a root at the start of label. Returns pitch class and length used.
std::optional<std::pair<int, size_t>> consumeRoot(std::string_view label) {
  if (label.empty()) return std::nullopt;
  char letter = static_cast<char>(std::toupper(static_cast<unsigned char>(label[0])));
  if (letter < 'A' || letter > 'G') return std::nullopt;

  int pitch = kLetterPitch[letter - 'A'];
  size_t pos = 1;
  for (int accidentals = 0; accidentals < 2 && pos < label.size(); ++accidentals) {
    if (label[pos] == '#') {
      ++pitch;
      ++pos;
    } else if (label[pos] == 'b') {
      --pitch;
      ++pos;
    } else if (label.compare(pos, kSharpSign.size(), kSharpSign) == 0) {
      ++pitch;
      pos += kSharpSign.size();
    } else if (label.compare(pos, kFlatSign.size(), kFlatSign) == 0) {
      --pitch;
      pos += kFlatSign.size();
    } else {
      break;
    }
  }
  return std::make_pair(((pitch % 12) + 12) % 12, pos);
}

int clampSemitones(int semitones) {
  return std::clamp(semitones, MIN_TRANSPOSE_SEMITONES, MAX_TRANSPOSE_SEMITONES);
}

std::string_view keyTonic(std::string_view key) {
  key = trim(key);
  return key.substr(0, key.find(' '));
}

}  // namespace

// ============================================================================
// Free functions
// ============================================================================

bool isNoChordLabel(std::string_view label) {
  std::string lower = toLower(trim(label));
  return lower.empty() || lower == "n" || lower == "n.c." || lower == "n/c" || lower == "nc" ||
         lower == "x";
}

std::optional<int> parsePitchClass(std::string_view root) {
  auto parsed = consumeRoot(root);
  if (!parsed || parsed->second != root.size()) return std::nullopt;
  return parsed->first;
}

const char* pitchClassName(int pitch_class) {
  return PITCH_CLASS_NAMES[((pitch_class % 12) + 12) % 12];
}

const char* spelledPitchName(int pitch_class, bool prefer_flats) {
  int index = ((pitch_class % 12) + 12) % 12;
  return prefer_flats ? FLAT_PITCH_NAMES[index] : SHARP_PITCH_NAMES[index];
}

bool usesFlatSpelling(std::string_view key) {
  std::string_view tonic = keyTonic(key);
  if (tonic.empty()) return false;
  if (tonic == "F" || tonic == "Cb") return true;
  // Position 0 is the letter, so "b minor" is not a flat key.
  return tonic.find('b', 1) != std::string_view::npos ||
         tonic.find(kFlatSign) != std::string_view::npos;
}

std::string transposeKey(const std::string& key, int semitones) {
  semitones = clampSemitones(semitones);
  std::string_view trimmed = trim(key);
  std::string_view tonic = keyTonic(trimmed);
  auto root = consumeRoot(tonic);
  if (!root || semitones == 0) return key;

  // The tonic may carry a mode shorthand ("F#m"); only the root moves.
  std::string result = spelledPitchName(root->first + semitones, usesFlatSpelling(trimmed));
  result.append(trimmed.substr(root->second));
  return result;
}

NormalizedChord transposeChord(const NormalizedChord& chord, int semitones,
                               const std::string& target_key) {
  semitones = clampSemitones(semitones);
  if (semitones == 0) return chord;

  int pitch_class = (chord.pitch_class + semitones + 12) % 12;
  NormalizedChord result = chord;
  result.pitch_class = static_cast<uint8_t>(pitch_class);
  result.root = spelledPitchName(pitch_class, usesFlatSpelling(target_key));
  result.display = result.root + result.suffix;
  return result;
}

std::string transposeLabel(const std::string& label, int semitones,
                           const std::string& target_key) {
  semitones = clampSemitones(semitones);
  std::string_view text = trim(label);
  if (semitones == 0 || isNoChordLabel(text)) return label;

  std::string_view chord_part = text;
  std::string_view bass;
  size_t slash = text.find('/');
  if (slash != std::string_view::npos) {
    chord_part = text.substr(0, slash);
    bass = text.substr(slash + 1);
  }

  auto root = consumeRoot(chord_part);
  if (!root) {
    CHORDGRID_LOG_DEBUG("Cannot transpose '" << label << "': no pitch-name root");
    return label;
  }

  const bool flats = usesFlatSpelling(target_key);
  std::string result = spelledPitchName(root->first + semitones, flats);
  result.append(chord_part.substr(root->second));
  if (slash == std::string_view::npos) return result;

  result += '/';
  if (auto bass_pitch = parsePitchClass(bass)) {
    result += spelledPitchName(*bass_pitch + semitones, flats);
  } else {
    result.append(bass);
  }
  return result;
}

std::string canonicalSuffix(const std::string& suffix) {
  if (const char* canonical = lookupSuffix(suffix)) return canonical;
  if (const char* canonical = lookupSuffixFolded(suffix)) return canonical;
  return suffix;
}

bool isKnownSuffix(const std::string& suffix) {
  return lookupSuffix(suffix) != nullptr || lookupSuffixFolded(suffix) != nullptr;
}

NormalizeResult normalizeChordLabel(const std::string& raw) {
  NormalizeResult result;
  std::string_view label = trim(raw);

  if (isNoChordLabel(label)) {
    result.status = LabelStatus::NoChord;
    return result;
  }

  // Inversion / bass note: only the part before the slash carries the chord.
  size_t slash = label.find('/');
  if (slash != std::string_view::npos) label = label.substr(0, slash);

  std::string_view root_part = label;
  std::string_view suffix_part;
  size_t colon = label.find(':');
  if (colon != std::string_view::npos) {
    root_part = label.substr(0, colon);
    suffix_part = label.substr(colon + 1);
  }

  auto root = consumeRoot(root_part);
  if (!root || (colon != std::string_view::npos && root->second != root_part.size())) {
    result.status = LabelStatus::Invalid;
    return result;
  }
  if (colon == std::string_view::npos) suffix_part = root_part.substr(root->second);

  std::string raw_suffix(suffix_part);
  if (!isKnownSuffix(raw_suffix)) {
    CHORDGRID_LOG_DEBUG("Unrecognized chord suffix '" << raw_suffix << "' in '" << raw
                                                      << "', keeping it verbatim");
  }

  NormalizedChord chord;
  chord.pitch_class = static_cast<uint8_t>(root->first);
  chord.root = pitchClassName(root->first);
  chord.suffix = canonicalSuffix(raw_suffix);
  chord.display = chord.root + chord.suffix;

  result.status = LabelStatus::Chord;
  result.chord = std::move(chord);
  return result;
}

std::string simplifySuffix(const std::string& suffix) {
  std::string lower = toLower(suffix);
  // Diminished before minor: "m7b5" and "dim" both contain 'm'.
  if (lower.find("dim") != std::string::npos || lower.find("b5") != std::string::npos ||
      lower.find("\xC2\xB0") != std::string::npos) {
    return "dim";
  }
  if (lower.find("aug") != std::string::npos || lower.find('+') != std::string::npos ||
      lower.find("#5") != std::string::npos) {
    return "aug";
  }
  if (lower.find("sus") != std::string::npos) return "sus";
  if (!suffix.empty() && suffix[0] == 'm' && lower.compare(0, 3, "maj") != 0) return "m";
  return "";
}

NormalizedChord simplifyChord(const NormalizedChord& chord) {
  NormalizedChord simple = chord;
  simple.suffix = simplifySuffix(chord.suffix);
  simple.display = simple.root + simple.suffix;
  return simple;
}

std::string simplifyLabel(const std::string& label) {
  NormalizeResult result = normalizeChordLabel(label);
  if (result.status != LabelStatus::Chord) return label;

  // Keep the caller's root spelling ("Dbm7" -> "Dbm", not "C#m").
  std::string_view text = trim(label);
  size_t colon = text.find(':');
  auto root = consumeRoot(text);
  std::string spelled(text.substr(0, colon != std::string_view::npos ? colon : root->second));
  spelled[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(spelled[0])));
  return spelled + simplifySuffix(result.chord->suffix);
}

// ============================================================================
// ChordNormalizer
// ============================================================================

ChordNormalizer::ChordNormalizer(size_t capacity) : capacity_(capacity) {}

NormalizeResult ChordNormalizer::normalize(const std::string& raw) {
  auto it = index_.find(raw);
  if (it != index_.end()) {
    ++hits_;
    entries_.splice(entries_.begin(), entries_, it->second);
    return it->second->second;
  }

  ++misses_;
  NormalizeResult result = normalizeChordLabel(raw);
  if (capacity_ == 0) return result;

  if (entries_.size() >= capacity_) {
    index_.erase(entries_.back().first);
    entries_.pop_back();
  }
  entries_.emplace_front(raw, result);
  index_[raw] = entries_.begin();
  return result;
}

void ChordNormalizer::clear() {
  entries_.clear();
  index_.clear();
  hits_ = 0;
  misses_ = 0;
}

}  // namespace chordgrid
