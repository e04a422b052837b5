#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

enum class Axis {
    Economic,
    Social,
    Authority,
    Globalism
};

constexpr std::array<Axis, 4> kAllAxes = {
    Axis::Economic, Axis::Social, Axis::Authority, Axis::Globalism
};

// Reference data: one weighted, directional term on one axis
struct KeywordEntry {
    std::string term;
    Axis axis;
    int direction;                    // -1 left/progressive/lib/nationalist, +1 opposite
    double weight;                    // 1-10
    std::vector<std::string> context; // at least one must appear, if non-empty
};

struct BiasRating {
    int economic = 0;
    int social = 0;
    int authority = 0;
    int globalism = 0;

    int get(Axis axis) const;
};

struct SourceEntry {
    std::string domain;
    std::string name;
    int factual_rating;  // 0-100
    BiasRating bias;     // each -100..100
    std::string category;
    std::optional<std::string> country;
};

struct AxisScore {
    int score = 0;    // -100..100
    int matches = 0;
};

// ---- Author model ----

enum class AuthorIntent {
    Organic,
    Troll,
    Bot,
    StateSponsored,
    Commercial,
    Activist
};

constexpr std::array<AuthorIntent, 6> kAllIntents = {
    AuthorIntent::Organic, AuthorIntent::Troll, AuthorIntent::Bot,
    AuthorIntent::StateSponsored, AuthorIntent::Commercial, AuthorIntent::Activist
};

struct IntentBreakdown {
    double organic = 0.0;
    double troll = 0.0;
    double bot = 0.0;
    double state_sponsored = 0.0;
    double commercial = 0.0;
    double activist = 0.0;

    double& at(AuthorIntent intent);
    double at(AuthorIntent intent) const;
    double total() const;
};

enum class SignalDirection {
    Authentic,
    Suspicious,
    Neutral
};

struct AuthorSignal {
    std::string type;
    std::variant<double, std::string> value;
    double weight;
    SignalDirection direction;
};

enum class DataQuality {
    High,
    Medium,
    Low,
    Minimal
};

struct AuthorMetadata {
    std::optional<int> account_age_days;
    std::optional<bool> verified;
    std::optional<int64_t> followers;
};

struct ExtractedAuthor {
    std::string identifier;
    std::string platform;   // twitter, reddit, facebook, article, comment, unknown
    std::string display_name;
    std::string profile_url;
    AuthorMetadata metadata;
};

struct KnownActorEntry {
    std::string identifier;
    std::string platform;   // or "all"
    AuthorIntent category;
    double confidence;      // 0-1
    std::string source;
    std::string added_date;
    std::optional<std::string> attribution;
};

struct IntentAssessment {
    AuthorIntent primary = AuthorIntent::Organic;
    double confidence = 0.0;
    IntentBreakdown breakdown;
};

struct AuthorClassification {
    int authenticity = 0;   // 0-100
    int coordination = 0;   // 0-100
    IntentAssessment intent;
    std::vector<AuthorSignal> signals;
    DataQuality data_quality = DataQuality::Minimal;
    std::string author_id;
    std::string platform;
    std::optional<KnownActorEntry> known_actor;

    bool has_signal(const std::string& type) const;
};

// ---- Classification result ----

enum class ResultSource {
    Local,
    Enhanced
};

struct ClassificationResult {
    int economic = 0;
    int social = 0;
    int authority = 0;
    int globalism = 0;
    int truth_score = 50;
    double confidence = 0.0;
    ResultSource source = ResultSource::Local;
    int64_t timestamp_ms = 0;
    std::optional<AuthorClassification> author;

    int axis(Axis axis) const;
};

// ---- Preferences and filtering ----

enum class DisplayMode {
    Block,
    Overlay,
    Badge,
    Off,
    Disabled
};

using ScoreRange = std::pair<int, int>;

struct UserPreferences {
    std::optional<ScoreRange> economic_range;
    std::optional<ScoreRange> social_range;
    std::optional<ScoreRange> authority_range;
    std::optional<ScoreRange> globalism_range;

    int min_truth_score = 0;
    int min_authenticity = 0;
    int max_coordination = 100;
    std::vector<AuthorIntent> blocked_intents;

    DisplayMode display_mode = DisplayMode::Badge;
    bool enabled = true;
    std::vector<std::string> whitelisted_domains;
};

// Absent optional = not overridden. Ranges nest one level deeper so that an
// explicit "no range" override stays distinct from "not overridden".
struct PreferenceOverrides {
    std::optional<std::optional<ScoreRange>> economic_range;
    std::optional<std::optional<ScoreRange>> social_range;
    std::optional<std::optional<ScoreRange>> authority_range;
    std::optional<std::optional<ScoreRange>> globalism_range;

    std::optional<int> min_truth_score;
    std::optional<int> min_authenticity;
    std::optional<int> max_coordination;
    std::optional<std::vector<AuthorIntent>> blocked_intents;

    std::optional<DisplayMode> display_mode;

    int count() const;
};

struct SiteProfile {
    std::string id;
    std::string name;
    std::optional<std::string> description;
    std::vector<std::string> domains;
    PreferenceOverrides overrides;
};

enum class FilterVerdict {
    None,
    Badge,
    Overlay,
    Block
};

enum class FilterReason {
    Economic,
    Social,
    Authority,
    Globalism,
    Truthfulness,
    Authenticity,
    Coordination,
    Intent
};

struct FilterAction {
    FilterVerdict action = FilterVerdict::None;
    std::optional<FilterReason> reason;
    ClassificationResult result;
};

// ---- Name conversions ----

std::string to_string(Axis axis);
std::optional<Axis> axis_from_string(const std::string& name);

std::string to_string(AuthorIntent intent);
std::optional<AuthorIntent> intent_from_string(const std::string& name);

std::string to_string(SignalDirection direction);
std::string to_string(DataQuality quality);
std::optional<DataQuality> data_quality_from_string(const std::string& name);

std::string to_string(ResultSource source);

std::string to_string(DisplayMode mode);
std::optional<DisplayMode> display_mode_from_string(const std::string& name);

std::string to_string(FilterVerdict verdict);
std::optional<FilterVerdict> verdict_from_string(const std::string& name);

std::string to_string(FilterReason reason);
std::optional<FilterReason> filter_reason_from_string(const std::string& name);
