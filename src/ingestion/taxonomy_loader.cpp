/**
 * @file taxonomy_loader.cpp
 * @brief Taxonomy loading, category derivation and tag splitting
 */

#include <ingestion/taxonomy_loader.hpp>
#include <ingestion/csv_reader.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <filesystem>
#include <fstream>
#include <map>
#include <stdexcept>

namespace NewsCube {

namespace {

struct CategoryRule {
    const char* category;
    const char* domain;
    std::vector<const char*> terms;
};

// Checked in order, first hit wins
const std::vector<CategoryRule>& category_rules() {
    static const std::vector<CategoryRule> rules = {
        {"Event", "Business",
         {"acquisition", "merger", "partnership", "collaboration", "licensing", "buyout", "takeover",
          "biotech deal", "pharma deal", "m&a", "alliance", "option agreement", "co-development",
          "in-license", "out-license", "funding", "financing", "investment", "raises", "series a",
          "series b", "series c", "venture capital", "ipo", "private placement", "oversubscribed",
          "seed funding", "crossover round", "pipe", "dilutive financing", "non-dilutive funding",
          "led by", "participated", "syndicate", "biotech funding"}},
        {"Clinical", "Healthcare", {"clinical stage", "phase 2", "phase 3", "fda approval"}},
        {"Manufacturing", "Operations",
         {"in-house manufacturing", "contract manufacturing", "capacity shortage", "manufacturing",
          "contract"}},
        {"Therapy", "Healthcare", {"oncology", "cancer", "tumor", "immunotherapy", "car-t", "adc"}},
        {"Entity", "Healthcare", {"preclinical", "clinical-stage", "platform company", "therapeutic"}},
    };
    return rules;
}

const std::map<std::string, std::vector<std::string>>& variation_table() {
    static const std::map<std::string, std::vector<std::string>> table = {
        {"acquisition", {"acquire", "acquired", "acquires", "buy", "purchase", "purchased"}},
        {"merger", {"merge", "merged", "merges", "combine", "combined"}},
        {"partnership", {"partner", "partnered", "partners", "alliance", "collaborate"}},
        {"collaboration", {"collaborate", "collaborated", "collaborates", "cooperation"}},
        {"licensing", {"license", "licensed", "licenses", "licence", "licenced"}},
        {"buyout", {"buy out", "bought out"}},
        {"takeover", {"take over", "took over"}},
        {"alliance", {"strategic alliance", "partnership"}},
        {"option agreement", {"option", "option deal"}},
        {"co-development", {"co development", "joint development"}},
        {"in-license", {"in license", "in-licensing"}},
        {"out-license", {"out license", "out-licensing"}},
        {"clinical stage", {"clinical", "clinical-stage"}},
        {"phase 2", {"phase ii", "phase-2"}},
        {"phase 3", {"phase iii", "phase-3"}},
        {"fda approval", {"fda", "approved", "approval"}},
        {"funding", {"fund", "funded", "funds", "capital"}},
        {"financing", {"finance", "financed"}},
        {"investment", {"invest", "invested", "investor"}},
        {"raises", {"raise", "raised", "raising"}},
        {"venture capital", {"vc", "venture", "venture capitalist"}},
        {"ipo", {"initial public offering", "public offering", "go public"}},
        {"private placement", {"private", "placement"}},
        {"round", {"funding round", "investment round"}},
        {"capital raise", {"raise capital", "capital raising"}},
        {"oversubscribed", {"over-subscribed", "over subscribed"}},
        {"seed funding", {"seed", "seed round"}},
        {"crossover round", {"crossover"}},
        {"pipe", {"private investment in public equity"}},
        {"led by", {"lead investor", "leading"}},
        {"participated", {"participant", "participating"}},
        {"syndicate", {"syndicated", "syndication"}},
        {"biotech funding", {"biotech investment", "biotech capital"}},
        {"preclinical", {"pre-clinical"}},
        {"clinical-stage", {"clinical stage"}},
        {"platform company", {"platform"}},
        {"therapeutic", {"therapy"}},
    };
    return table;
}

// Tags that also receive the sheet's untagged "general" keywords
bool is_therapy_tag(const std::string& lower_name) {
    for (const char* term : {"therapy", "cancer", "oncology", "tumor", "immunotherapy", "car-t", "adc"}) {
        if (contains(lower_name, term)) return true;
    }
    return false;
}

void add_unique(std::vector<std::string>& list, const std::string& value) {
    std::string v = trim(value);
    if (v.empty()) return;
    for (const auto& existing : list) {
        if (existing == v) return;
    }
    list.push_back(std::move(v));
}

int column_index(const std::vector<std::string>& header, const char* name) {
    std::string wanted = to_lower(name);
    for (size_t i = 0; i < header.size(); ++i) {
        if (to_lower(trim(header[i])) == wanted) return static_cast<int>(i);
    }
    return -1;
}

struct RawTag {
    std::string name;
    std::string category;
    std::string domain;
    std::vector<std::string> keywords;
    bool individually = false;
};

} // namespace

std::pair<std::string, std::string> TaxonomyLoader::derive_category(const std::string& tag_name,
                                                                    const std::vector<std::string>& keywords) {
    std::string all_text = to_lower(tag_name + " " + join(keywords, " "));
    for (const auto& rule : category_rules()) {
        for (const char* term : rule.terms) {
            if (contains(all_text, term)) return {rule.category, rule.domain};
        }
    }
    return {"Other", "General"};
}

std::vector<std::string> TaxonomyLoader::keyword_variations(const std::string& tag_name) {
    std::string lower = to_lower(trim(tag_name));

    auto it = variation_table().find(lower);
    if (it != variation_table().end()) return it->second;

    if (contains(lower, "deal")) return {"agreement", "transaction", "contract"};
    if (contains(lower, "dilutive")) return {"dilutive financing", "non-dilutive financing"};
    if (starts_with(lower, "series ")) {
        std::string letter = split_whitespace(lower).back();
        return {"series " + letter, "series" + letter, letter + " round"};
    }
    return {};
}

TagTaxonomy TaxonomyLoader::parse(std::istream& in) {
    CsvReader reader(in);

    std::vector<std::string> header;
    if (!reader.next(header)) return {};

    const int name_col = column_index(header, "Tag_Name");
    const int category_col = column_index(header, "Tag_Category");
    const int domain_col = column_index(header, "Tag_Domain");
    const int keywords_col = column_index(header, "Keywords");
    const int individually_col = column_index(header, "Individually");

    if (name_col < 0) {
        throw std::runtime_error("Taxonomy file has no Tag_Name column");
    }

    auto cell = [](const std::vector<std::string>& row, int idx) -> std::string {
        return (idx >= 0 && static_cast<size_t>(idx) < row.size()) ? trim(row[idx]) : std::string();
    };

    std::vector<RawTag> raw;
    std::vector<std::string> general_keywords;
    std::vector<std::string> row;

    while (reader.next(row)) {
        std::string name = cell(row, name_col);
        std::vector<std::string> row_keywords = split_any(to_lower(cell(row, keywords_col)), ";|");

        if (name.empty()) {
            for (const auto& kw : row_keywords) add_unique(general_keywords, kw);
            continue;
        }

        RawTag tag;
        tag.name = name;
        tag.category = cell(row, category_col);
        tag.domain = cell(row, domain_col);
        tag.individually = to_lower(cell(row, individually_col)) == "individually" ||
                           to_lower(cell(row, individually_col)) == "yes" ||
                           to_lower(cell(row, individually_col)) == "true";

        add_unique(tag.keywords, to_lower(name));
        for (const auto& kw : row_keywords) add_unique(tag.keywords, kw);
        for (const auto& kw : keyword_variations(name)) add_unique(tag.keywords, kw);

        raw.push_back(std::move(tag));
    }

    // Merge duplicate names; the first occurrence keeps its category
    TagTaxonomy taxonomy;
    std::map<std::string, size_t> index;

    auto emit = [&](const std::string& name, const std::string& category, const std::string& domain,
                    const std::vector<std::string>& keywords) {
        auto it = index.find(name);
        if (it != index.end()) {
            for (const auto& kw : keywords) add_unique(taxonomy[it->second].keywords, kw);
            return;
        }
        TagDefinition def;
        def.name = name;
        def.keywords = keywords;
        def.category = category;
        def.domain = domain;
        index.emplace(name, taxonomy.size());
        taxonomy.push_back(std::move(def));
    };

    for (auto& tag : raw) {
        if (is_therapy_tag(to_lower(tag.name))) {
            for (const auto& kw : general_keywords) add_unique(tag.keywords, kw);
        }
        if (tag.category.empty() || tag.domain.empty()) {
            auto derived = derive_category(tag.name, tag.keywords);
            if (tag.category.empty()) tag.category = derived.first;
            if (tag.domain.empty()) tag.domain = derived.second;
        }

        if (tag.individually && tag.keywords.size() > 1) {
            for (const auto& kw : tag.keywords) {
                emit(kw, tag.category, tag.domain, {kw});
            }
        } else {
            emit(tag.name, tag.category, tag.domain, tag.keywords);
        }
    }

    return taxonomy;
}

TagTaxonomy TaxonomyLoader::load(const std::string& path) {
    if (path.empty() || !std::filesystem::exists(path)) {
        Logger::warn("Tag taxonomy not found" + (path.empty() ? std::string() : ": " + path) +
                     " (tag matching disabled)");
        return {};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open taxonomy file: " + path);
    }

    TagTaxonomy taxonomy = parse(file);
    Logger::info("Loaded " + std::to_string(taxonomy.size()) + " tag definitions from " + path);
    return taxonomy;
}

} // namespace NewsCube
