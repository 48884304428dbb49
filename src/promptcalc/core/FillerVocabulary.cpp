#include "promptcalc/core/FillerVocabulary.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace promptcalc::core {

namespace {

// 单词条目
const char* const kFillerWords[] = {
    "actually", "basically", "literally", "obviously", "clearly", "essentially", "definitely", "absolutely",
    "certainly", "particularly", "specifically", "generally", "typically", "usually", "normally", "frequently",
    "commonly", "often", "sometimes", "perhaps", "maybe", "possibly", "probably", "likely",
    "presumably", "apparently", "seemingly", "arguably", "supposedly", "allegedly", "reportedly", "theoretically",
    "practically", "virtually", "effectively", "fundamentally", "primarily", "mainly", "mostly", "largely",
    "significantly", "considerably", "substantially", "notably", "remarkably", "surprisingly", "interestingly", "importantly",
    "unfortunately", "fortunately", "hopefully", "evidently", "undoubtedly", "completely", "entirely", "totally",
    "fully", "quite", "rather", "fairly", "pretty", "somewhat", "slightly", "relatively",
    "comparatively", "extremely", "incredibly", "amazingly", "exceptionally", "extraordinarily", "tremendously", "enormously",
    "immensely", "vastly", "hugely", "massively", "dramatically", "especially", "precisely", "exactly",
    "perfectly", "surely", "hypothetically", "potentially", "conceivably", "debatably", "questionably", "doubtfully",
    "uncertainly", "tentatively", "provisionally", "conditionally", "temporarily", "momentarily", "briefly", "shortly",
    "quickly", "rapidly", "swiftly", "immediately", "instantly", "suddenly", "abruptly", "gradually",
    "slowly", "steadily", "consistently", "constantly", "continually", "continuously", "repeatedly", "regularly",
    "occasionally", "rarely", "seldom", "hardly", "barely", "scarcely", "nearly", "almost",
    "approximately", "roughly", "about", "around", "near", "nearby", "adjacent", "neighboring",
    "surrounding", "encompassing", "including", "containing", "comprising", "consisting", "involving", "concerning",
    "regarding", "relating", "pertaining", "referring", "alluding", "mentioning", "noting", "observing",
    "remarking", "commenting", "stating", "declaring", "announcing", "proclaiming", "asserting", "claiming",
    "arguing", "contending", "maintaining", "insisting", "emphasizing", "stressing", "highlighting", "underscoring",
    "accentuating", "focusing", "concentrating", "centering", "targeting", "aiming", "directing", "orienting",
    "positioning", "placing", "locating", "situating", "establishing", "setting", "creating", "forming",
    "developing", "building", "constructing", "assembling", "organizing", "arranging", "structuring", "designing",
    "planning", "preparing", "making", "producing", "generating", "causing", "resulting", "leading",
    "bringing", "taking", "giving", "providing", "offering", "supplying", "delivering", "presenting",
    "showing", "displaying", "exhibiting", "demonstrating", "revealing", "exposing", "uncovering", "discovering",
    "finding", "identifying", "recognizing", "acknowledging", "accepting", "admitting", "confessing", "conceding",
    "agreeing", "consenting", "approving", "endorsing", "supporting", "backing", "advocating", "promoting",
    "encouraging", "urging", "recommending", "suggesting", "proposing", "advising", "counseling", "guiding",
    "instructing", "teaching", "educating", "informing", "telling", "explaining", "describing", "detailing",
    "outlining", "summarizing", "reviewing", "examining", "analyzing", "evaluating", "assessing", "judging",
    "determining", "deciding", "choosing", "selecting", "picking", "opting", "preferring", "favoring",
    "liking", "enjoying", "appreciating", "valuing", "treasuring", "cherishing", "loving", "adoring",
    "worshipping", "revering", "respecting", "honoring", "admiring", "praising", "complimenting", "congratulating",
    "thanking", "rewarding", "compensating", "paying", "spending", "investing", "contributing", "donating",
    "performing", "executing", "implementing", "conducting", "managing", "handling", "addressing", "tackling",
    "approaching", "confronting", "facing", "meeting", "encountering", "experiencing", "undergoing", "suffering",
    "enduring", "tolerating", "embracing", "welcoming", "greeting", "receiving", "getting", "obtaining",
    "acquiring", "gaining", "earning", "winning", "achieving", "accomplishing", "completing", "finishing",
    "ending", "concluding", "terminating", "stopping", "ceasing", "quitting", "abandoning", "leaving",
    "departing", "going", "coming", "arriving", "reaching", "nearing", "closing", "opening",
    "starting", "beginning", "commencing", "initiating", "launching", "introducing", "proving", "confirming",
    "verifying", "validating", "authenticating", "certifying", "guaranteeing", "ensuring", "securing", "protecting",
    "defending", "guarding", "shielding", "covering", "hiding", "concealing", "masking", "disguising",
    "camouflaging", "obscuring", "blocking", "preventing", "avoiding", "evading", "escaping", "fleeing",
    "running", "walking", "moving", "traveling", "journeying", "staying", "remaining", "continuing",
    "proceeding", "advancing", "progressing", "growing", "expanding", "increasing", "rising", "climbing",
    "ascending", "descending", "falling", "dropping", "declining", "decreasing", "reducing", "diminishing",
    "shrinking", "contracting", "compressing", "squeezing", "pressing", "pushing", "pulling", "dragging",
    "lifting", "raising", "lowering", "putting", "laying", "resting", "sitting", "standing",
    "lying", "sleeping", "waking", "succeeding", "failing", "losing", "founding", "spotting",
    "noticing", "seeing", "looking", "watching", "viewing", "inspecting", "checking", "testing",
    "trying", "attempting", "endeavoring", "striving", "struggling", "fighting", "battling", "competing",
    "contesting", "challenging", "opposing", "resisting", "helping", "assisting", "aiding", "serving",
    "working", "laboring", "toiling", "operating", "functioning", "controlling", "supervising", "overseeing",
    "monitoring", "tracking", "following", "pursuing", "chasing", "hunting", "searching", "seeking",
    "handing", "passing", "sending", "transmitting", "conveying", "communicating", "expressing", "saying",
    "speaking", "talking", "discussing", "conversing", "chatting", "gossiping", "whispering", "shouting",
    "yelling", "screaming", "crying", "laughing", "smiling", "grinning", "frowning", "scowling",
    "glaring", "staring", "gazing", "distinguishing", "differentiating", "separating", "dividing", "splitting",
    "breaking", "cracking", "smashing", "destroying", "demolishing", "ruining", "damaging", "harming",
    "hurting", "injuring", "wounding", "cutting", "slicing", "chopping", "stabbing", "piercing",
    "penetrating", "entering", "inserting", "shaping", "molding", "sculpting", "carving", "trimming",
    "pruning", "clipping", "snipping", "cropping", "harvesting", "gathering", "collecting", "accumulating",
    "amassing", "stockpiling", "storing", "keeping", "holding", "retaining", "preserving", "conserving",
    "safeguarding", "wrapping", "packaging", "boxing", "bagging", "enclosing", "hugging", "grasping",
    "gripping", "clutching", "shoving", "forcing", "compelling", "boosting", "enhancing", "improving",
    "bettering", "upgrading", "extending", "stretching", "touching", "feeling", "sensing", "perceiving",
    "detecting", "knowing", "understanding", "comprehending", "realizing", "inferring", "deducing", "reasoning",
    "thinking", "considering", "pondering", "reflecting", "contemplating", "meditating", "listening", "hearing",
    "sounds", "noises", "music", "songs", "melodies", "tunes", "rhythms", "beats",
    "tempos", "speeds", "rates", "paces", "velocities", "accelerations", "movements", "motions",
    "actions", "activities", "behaviors", "conducts", "manners", "ways", "methods", "techniques",
    "approaches", "strategies", "plans", "schemes", "designs", "patterns", "structures", "systems",
    "organizations", "arrangements", "orders", "sequences", "series", "chains", "links", "connections",
    "relationships", "associations", "bonds", "ties", "attachments", "affiliations", "memberships", "participations",
    "involvements", "engagements", "commitments", "obligations", "duties", "responsibilities", "tasks", "jobs",
    "works", "labors", "efforts", "attempts", "tries", "endeavors", "struggles", "fights",
    "battles", "wars", "conflicts", "disputes", "arguments", "debates", "discussions", "conversations",
    "talks", "speeches", "presentations", "lectures", "lessons", "classes", "courses", "programs",
    "curricula", "syllabi", "schedules", "timetables", "calendars", "dates", "times", "moments",
    "instances", "occasions", "events", "happenings", "occurrences", "incidents", "accidents", "emergencies",
    "crises", "problems", "issues", "matters", "concerns", "worries", "fears", "anxieties",
    "stresses", "pressures", "tensions", "strains", "burdens", "loads", "weights", "masses",
    "amounts", "quantities", "numbers", "figures", "statistics", "data", "information", "facts",
    "details", "particulars", "specifics", "elements", "components", "parts", "pieces", "sections",
    "segments", "portions", "fractions", "percentages", "ratios", "proportions", "forces", "powers",
    "energies", "strengths", "intensities", "magnitudes", "sizes", "dimensions", "measurements", "distances",
    "lengths", "widths", "heights", "depths", "thicknesses", "volumes", "capacities", "spaces",
    "areas", "surfaces", "exteriors", "interiors", "insides", "outsides", "fronts", "backs",
    "sides", "tops", "bottoms", "lefts", "rights", "centers", "middles", "edges",
    "borders", "boundaries", "limits", "extents", "ranges", "scopes", "spans", "reaches",
    "stretches", "extensions", "expansions", "growths", "developments", "progressions", "advances", "improvements",
    "enhancements", "upgrades", "updates", "revisions", "modifications", "changes", "alterations", "adjustments",
    "adaptations", "accommodations", "models", "examples", "cases", "situations", "circumstances", "conditions",
    "states", "statuses", "positions", "locations", "places", "spots", "sites", "regions",
    "zones", "districts", "neighborhoods", "communities", "societies", "groups", "teams", "companies",
    "businesses", "enterprises", "corporations", "institutions", "establishments", "facilities", "buildings", "constructions",
    "architectures", "blueprints", "diagrams", "charts", "graphs", "tables", "lists", "catalogs",
    "inventories", "records", "documents", "papers", "files", "folders", "directories", "databases",
    "networks", "partnerships", "collaborations", "cooperations", "alliances", "unions", "federations", "confederations",
    "leagues", "coalitions", "blocs", "clusters", "collections", "assemblies", "gatherings", "meetings",
    "conferences", "conventions", "summits", "forums", "panels", "committees", "boards", "councils",
    "parliaments", "congresses", "senates", "houses", "chambers", "rooms", "venues", "settings",
    "environments", "surroundings", "contexts", "backgrounds", "histories", "pasts", "presents", "futures",
    "periods", "eras", "ages", "epochs", "generations", "decades", "years", "months",
    "weeks", "days", "hours", "minutes", "seconds", "instants", "intervals", "durations",
};

// 多词短语（词间单个空格）。首词本身已是单词条目的短语（"setting up" 等）
// 永远先按单词命中，因此不列入
const char* const kFillerPhrases[] = {
    "close to", "carrying out", "dealing with", "adding to",
};

bool isWordChar(char c) {
    const auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) != 0 || c == '_';
}

std::string toLowerCopy(std::string_view in) {
    std::string out(in);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::size_t countWords(std::string_view phrase) {
    std::size_t n = 0;
    bool inWord = false;
    for (char c : phrase) {
        if (c == ' ') {
            inWord = false;
        } else if (!inWord) {
            inWord = true;
            ++n;
        }
    }
    return n;
}

std::vector<std::string> builtinEntries() {
    std::vector<std::string> entries;
    entries.reserve(sizeof(kFillerWords) / sizeof(kFillerWords[0]) +
                    sizeof(kFillerPhrases) / sizeof(kFillerPhrases[0]));
    for (const char* w : kFillerWords) entries.emplace_back(w);
    for (const char* p : kFillerPhrases) entries.emplace_back(p);
    return entries;
}

} // namespace

const FillerVocabulary& FillerVocabulary::builtin() {
    static const FillerVocabulary vocab(builtinEntries());
    return vocab;
}

FillerVocabulary::FillerVocabulary(const std::vector<std::string>& entries) {
    for (const auto& e : entries) {
        auto low = toLowerCopy(e);
        if (low.empty()) continue;
        if (low.find(' ') == std::string::npos) {
            m_words.insert(std::move(low));
            continue;
        }
        m_maxPhraseWords = std::max(m_maxPhraseWords, countWords(low));
        m_phrases.insert(std::move(low));
    }
}

bool FillerVocabulary::containsWord(std::string_view word) const {
    return m_words.find(toLowerCopy(word)) != m_words.end();
}

bool FillerVocabulary::containsPhrase(std::string_view phrase) const {
    return m_phrases.find(toLowerCopy(phrase)) != m_phrases.end();
}

std::string FillerVocabulary::removeFrom(std::string_view text) const {
    std::string out;
    out.reserve(text.size());

    auto wordEnd = [&](std::size_t from) {
        std::size_t j = from;
        while (j < text.size() && isWordChar(text[j])) ++j;
        return j;
    };

    std::size_t i = 0;
    while (i < text.size()) {
        if (!isWordChar(text[i])) {
            out.push_back(text[i]);
            ++i;
            continue;
        }

        // 收集从 i 开始、以单个空格相连的最多 m_maxPhraseWords 个词的结束位置
        std::vector<std::size_t> ends;
        std::size_t cur = wordEnd(i);
        ends.push_back(cur);
        while (ends.size() < m_maxPhraseWords && cur + 1 < text.size() && text[cur] == ' ' &&
               isWordChar(text[cur + 1])) {
            cur = wordEnd(cur + 1);
            ends.push_back(cur);
        }

        std::size_t matchEnd = 0;
        for (std::size_t k = ends.size(); k >= 2; --k) {
            if (containsPhrase(text.substr(i, ends[k - 1] - i))) {
                matchEnd = ends[k - 1];
                break;
            }
        }
        if (matchEnd == 0 && containsWord(text.substr(i, ends.front() - i))) {
            matchEnd = ends.front();
        }

        if (matchEnd == 0) {
            out.append(text.substr(i, ends.front() - i));
            i = ends.front();
            continue;
        }

        i = matchEnd;
        if (i < text.size() && text[i] == ' ') ++i;
    }
    return out;
}

} // namespace promptcalc::core
