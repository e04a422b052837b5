#include "patterns.hpp"
#include <algorithm>
#include <iterator>

// std::regex recurses once per repeated character, so every repeat in these
// tables is bounded to keep long single-line input off the stack limit.

namespace {

constexpr auto kIcase = std::regex::ECMAScript | std::regex::icase;

std::vector<std::regex> compile_icase(std::initializer_list<const char*> sources) {
    std::vector<std::regex> compiled;
    compiled.reserve(sources.size());
    for (const char* src : sources) {
        compiled.emplace_back(src, kIcase);
    }
    return compiled;
}

} // namespace

const std::vector<std::string>& PatternLibrary::clickbait_phrases() {
    static const std::vector<std::string> phrases = {
        "you won't believe",
        "shocking",
        "mind-blowing",
        "what happens next",
        "this will change",
        "secret revealed",
        "they don't want you to know",
        "share before deleted",
        "breaking:"
    };
    return phrases;
}

const std::vector<std::string>& PatternLibrary::sensational_words() {
    static const std::vector<std::string> words = {
        "outrage", "disgusting", "horrific", "amazing", "incredible",
        "terrifying", "explosive", "bombshell", "slammed", "destroyed"
    };
    return words;
}

const std::vector<std::string>& PatternLibrary::citation_phrases() {
    static const std::vector<std::string> phrases = {
        "according to",
        "reported by",
        "study shows",
        "research indicates",
        "data from",
        "http",
        "source:"
    };
    return phrases;
}

const std::regex& PatternLibrary::statistic_pattern() {
    static const std::regex pattern(R"(\d{1,20}%|\d{1,20}\.\d{1,20}|\$\d{1,20}|\d{4})");
    return pattern;
}

const std::vector<std::string>& PatternLibrary::emotional_words() {
    static const std::vector<std::string> words = {
        "outrage", "disgusting", "horrific", "unbelievable", "shocking",
        "pathetic", "idiotic", "insane", "radical", "extremist",
        "destroy", "attack", "enemy", "traitor", "corrupt", "evil",
        "terrible", "awful", "horrible", "despicable", "vile"
    };
    return words;
}

const std::vector<std::regex>& PatternLibrary::attack_patterns() {
    static const std::vector<std::regex> patterns = compile_icase({
        R"(you('re| are) (an? )?(idiot|moron|stupid|dumb))",
        R"(people like you)",
        R"(wake up,? (sheeple|sheep))",
        R"((libtard|conservatard|snowflake|cuck|shill))",
        R"(go back to)",
        R"(typical (liberal|conservative|leftist|rightist))",
        R"(you (must|probably) (work for|be paid by))"
    });
    return patterns;
}

const std::vector<std::regex>& PatternLibrary::bad_faith_patterns() {
    static const std::vector<std::regex> patterns = compile_icase({
        R"(what about)",
        R"(so you('re)? saying)",
        R"(typical \w{1,30} response)",
        R"(you (probably|must) (think|believe))",
        R"(nice try,? but)",
        R"(that's rich coming from)"
    });
    return patterns;
}

const std::vector<std::regex>& PatternLibrary::engagement_bait_patterns() {
    static const std::vector<std::regex> patterns = compile_icase({
        R"(change my mind)",
        R"(fight me)",
        R"(prove me wrong)",
        R"(bet you (can't|won't))",
        R"(i dare (you|anyone))",
        R"(unpopular opinion:?)",
        R"(hot take:?)",
        R"(controversial:?)"
    });
    return patterns;
}

const std::vector<std::regex>& PatternLibrary::promotional_patterns() {
    static const std::vector<std::regex> patterns = compile_icase({
        R"(buy now)",
        R"(limited time)",
        R"(click (here|the link))",
        R"(check out)",
        R"(don't miss)",
        R"(exclusive offer)",
        R"(use code)",
        R"(sign up)",
        R"(subscribe)",
        R"(free trial)"
    });
    return patterns;
}

const std::vector<std::regex>& PatternLibrary::template_patterns() {
    static const std::vector<std::regex> patterns = [] {
        std::vector<std::regex> p;
        p.emplace_back(R"(\[name\]|\[company\]|\[product\])", kIcase);
        p.emplace_back(R"(\{\{[^{}]{0,100}\}\})");
        p.emplace_back(R"(%[A-Z_]{1,40}%)");
        p.emplace_back(R"(INSERT [^.!?\n]{1,80} HERE)", kIcase);
        p.emplace_back(R"(\{your[^}]{0,100}\})", kIcase);
        return p;
    }();
    return patterns;
}

const std::vector<std::regex>& PatternLibrary::affiliate_patterns() {
    static const std::vector<std::regex> patterns = compile_icase({
        R"(\?ref=)",
        R"(\?aff=)",
        R"(\?tag=)",
        R"(affiliate)",
        R"(amzn\.to)",
        R"(bit\.ly)",
        R"(tinyurl)",
        R"(linktr\.ee)"
    });
    return patterns;
}

const std::vector<std::regex>& PatternLibrary::whataboutism_patterns() {
    static const std::vector<std::regex> patterns = compile_icase({
        R"(what about)",
        R"(but (what|how) about)",
        R"(yeah,? but)",
        R"(but they (also|did))"
    });
    return patterns;
}

const std::vector<WeightedMarker>& PatternLibrary::personal_voice_markers() {
    static const std::vector<WeightedMarker> markers = {
        {std::regex(R"(\bi\s{1,20}(think|believe|feel|wonder|guess))"), 0.2},
        {std::regex(R"(\bmy (experience|opinion|view|take))"), 0.2},
        {std::regex(R"(\b(maybe|perhaps|might|could be|seems like))"), 0.15},
        {std::regex(R"(\b(i'm not sure|i could be wrong|correct me if))"), 0.2},
        {std::regex(R"(\bi (was|went|saw|heard|met|talked))"), 0.1}
    };
    return markers;
}

const std::vector<WeightedMarker>& PatternLibrary::nuance_markers() {
    static const std::vector<WeightedMarker> markers = {
        {std::regex(R"(\b(on the other hand|however|although|while|granted))"), 0.2},
        {std::regex(R"(\b(it depends|in some cases|under certain))"), 0.15},
        {std::regex(R"(\b(complex|nuanced|complicated|multifaceted))"), 0.15},
        {std::regex(R"(\b(according to|research shows|studies indicate|data suggests))"), 0.2},
        {std::regex(R"(\b(i (don't|can't) (know|say) for sure|more research|not an expert))"), 0.1}
    };
    return markers;
}

const std::regex& PatternLibrary::genuine_question_pattern() {
    static const std::regex pattern(R"(\?[^?!]{0,300}\?)");
    return pattern;
}

const std::regex& PatternLibrary::rhetorical_question_pattern() {
    static const std::regex pattern(R"(\b(seriously|really|honestly)\?)");
    return pattern;
}

int PatternLibrary::count_matches(const std::string& text, const std::regex& pattern) {
    auto begin = std::sregex_iterator(text.begin(), text.end(), pattern);
    return static_cast<int>(std::distance(begin, std::sregex_iterator()));
}

int PatternLibrary::count_matches(const std::string& text, const std::vector<std::regex>& patterns) {
    int total = 0;
    for (const auto& pattern : patterns) {
        total += count_matches(text, pattern);
    }
    return total;
}

int PatternLibrary::count_present(const std::string& text, const std::vector<std::string>& phrases) {
    return static_cast<int>(std::count_if(phrases.begin(), phrases.end(),
        [&text](const std::string& p) { return text.find(p) != std::string::npos; }));
}

bool PatternLibrary::any_present(const std::string& text, const std::vector<std::string>& phrases) {
    return count_present(text, phrases) > 0;
}
