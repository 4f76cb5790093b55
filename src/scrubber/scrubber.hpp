#ifndef CLINSCRUB_SCRUBBER_SCRUBBER_HPP
#define CLINSCRUB_SCRUBBER_SCRUBBER_HPP

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <vector>
#include "../../config/default_terms.hpp"
#include "../../config/scrubber_config.hpp"
#include "../util/logger.hpp"
#include "category.hpp"
#include "dictionary_builder.hpp"
#include "name_filter.hpp"
#include "normalizer.hpp"
#include "pattern_builder.hpp"
#include "punctuation_tidier.hpp"
#include "redaction_stats.hpp"
#include "replacement.hpp"

/**
 * @file scrubber.hpp
 * @brief The pattern-cascade redaction engine.
 *
 * DESIGN:
 *   - Every detector is compiled once in the constructor and owned by the
 *     instance. Nothing is cached process-wide, so differently configured
 *     engines can coexist.
 *   - scrub() normalizes the note, runs the category passes in a fixed
 *     order (each skippable), then tidies punctuation. Later passes see the
 *     text already rewritten by earlier ones.
 *   - A constructed Scrubber is immutable; scrub() is const and may be
 *     called concurrently from several threads.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace clinscrub;
 *   config::ScrubberConfig cfg;
 *   cfg.names.push_back("Zelda Fitzgerald");
 *   scrubber::Scrubber engine(cfg);
 *
 *   scrubber::CategorySet skip{scrubber::Category::Date};
 *   scrubber::ScrubResult r = engine.scrub(noteText, skip);
 *   // r.text has placeholders such as [PERSON]; r.stats.persons counts them
 *   @endcode
 */

namespace clinscrub {
namespace scrubber {

/**
 * @brief Redacted text and per-category counts for one scrub() call.
 */
struct ScrubResult
{
    std::string text;
    RedactionStats stats;
};

class Scrubber
{
public:
    /**
     * @brief Build and validate every detector.
     * @throw std::invalid_argument if the MRN digit range is invalid.
     * @throw std::runtime_error if any pattern fails to compile.
     */
    explicit Scrubber(const config::ScrubberConfig &cfg)
        : mrnMinLength_(cfg.effectiveMrnMinLength()),
          mrnMaxLength_(cfg.effectiveMrnMaxLength())
    {
        cfg.validate();

        const auto icase = std::regex::ECMAScript | std::regex::icase;
        const std::string sp = pattern::spaces();
        const std::string osp = pattern::optionalSpaces();

        // Local part and domain limits follow RFC 5321.
        emailRegex_ = pattern::compile(
            "email", R"(\b[\w.+%\-]{1,64}@[A-Za-z0-9.\-]{1,253}\.[A-Za-z]{2,63}\b)", icase);

        // Bullets are folded to spaces by the normalizer, so \s covers them.
        phoneRegex_ = pattern::compile(
            "phone",
            R"((?:(?:\+|\b)1[\-.\s]?(?:\(\d{3}\)|\d{3})|\(\d{3}\)|\b\d{3}))"
            R"([\-.\s]?\d{3}[\-.\s]?\d{4})"
            "(?:" + osp + "(?:extension|ext\\.?|x)" + osp + R"(\d{1,6})?\b)",
            icase);

        ssnRegex_ = pattern::compile("ssn", R"(\b(?:\d{3}-\d{2}-\d{4}|[xX]{3}-[xX]{2}-\d{4})\b)");

        mrnLabelRegex_ = pattern::compile(
            "mrn label",
            R"(\b(?:MRN|Acct|Account|Patient)" + osp + "ID|Chart)" + osp + "[:#]?" + osp + "-?" +
                osp + R"([A-Za-z0-9\-]{4,64}\b)",
            icase);
        mrnRegex_ = pattern::compile("mrn", R"(\b\d{)" + std::to_string(mrnMinLength_) + "," +
                                                std::to_string(mrnMaxLength_) + R"(}\b)");

        zipRegex_ = pattern::compile("zip", R"(\b\d{5}(?:-\d{4})?\b)");

        facilityRegex_ = pattern::compile("facility", buildFacilityPattern());
        facilityTerms_ = buildDictionary(config::defaultFacilityTerms(), cfg.keywords);
        customFacilityRegex_ = buildDictionaryRegex("facility dictionary", facilityTerms_);

        addressRegex_ = pattern::compile("address", buildAddressPattern());

        const std::string ordinate =
            R"(-?\b\d{1,3}\.\d{1,15})" + osp + "(?:\xC2\xB0|\xC2\xBA)?" + osp;
        coordinateRegex_ = pattern::compile(
            "coordinate", ordinate + R"([NS]\b[,\s]{0,16})" + ordinate + R"([EW]\b)", icase);

        nameTerms_ = buildDictionary(config::defaultSurnames(), cfg.names);
        nameDictionaryRegex_ = buildDictionaryRegex("name dictionary", nameTerms_);
        titledNameRegex_ = pattern::compile("titled name", buildTitledNamePattern());
        firstLastRegex_ = pattern::compile("first+surname", buildFirstLastPattern());
        capitalSequenceRegex_ = pattern::compile("capitalized sequence", buildCapitalSequencePattern());

        dateRegex_ = pattern::compile("date", buildDatePattern(), icase);

        relativeDateRegex_ = pattern::compile(
            "relative date",
            R"(\b(?:yesterday|today|tomorrow|)"
            "last" + sp +
                "(?:night|week|month|year|Monday|Tuesday|Wednesday|Thursday|Friday|Saturday|Sunday)|"
                "this" + sp + "(?:morning|afternoon|evening|week|month)|" +
                R"(\d{1,6})" + sp + "(?:days|day|weeks|week|months|month|years|year)" + sp +
                R"(ago)\b)",
            icase);

        util::logger::info("Scrubber: initialized with " + std::to_string(nameTerms_.size()) +
                           " name terms, " + std::to_string(facilityTerms_.size()) +
                           " facility terms, MRN length " + std::to_string(mrnMinLength_) + "-" +
                           std::to_string(mrnMaxLength_));
    }

    /**
     * @brief Redact one note.
     * @param input UTF-8 note text; any string is accepted.
     * @param skip Categories to leave untouched. Their counts stay zero.
     */
    ScrubResult scrub(const std::string &input, const CategorySet &skip = CategorySet()) const
    {
        ScrubResult result;
        RedactionStats &stats = result.stats;
        std::string output = normalizeText(input);

        if (!skip.contains(Category::Email)) {
            stats.emails = apply(emailRegex_, output, config::kEmailToken);
        }

        if (!skip.contains(Category::Phone)) {
            stats.phones = apply(phoneRegex_, output, config::kPhoneToken);
        }

        if (!skip.contains(Category::Ssn)) {
            stats.ssn = apply(ssnRegex_, output, config::kSsnToken);
        }

        if (!skip.contains(Category::Mrn)) {
            // Labeled identifiers first so the bare-digit pass can't split them.
            stats.mrn = apply(mrnLabelRegex_, output, config::kMrnToken);
            stats.mrn += apply(mrnRegex_, output, config::kMrnToken);
        }

        if (!skip.contains(Category::Zip)) {
            stats.zipCodes = apply(zipRegex_, output, config::kZipToken);
        }

        if (!skip.contains(Category::Facility)) {
            stats.facilities = apply(facilityRegex_, output, config::kFacilityToken);
            if (customFacilityRegex_) {
                stats.facilities += apply(*customFacilityRegex_, output, config::kFacilityToken);
            }
        }

        if (!skip.contains(Category::Address)) {
            stats.addresses = apply(addressRegex_, output, config::kAddressToken);
        }

        if (!skip.contains(Category::Coordinate)) {
            stats.coordinates = apply(coordinateRegex_, output, config::kCoordinateToken);
        }

        if (!skip.contains(Category::Person)) {
            if (nameDictionaryRegex_) {
                stats.persons += applyPerson(*nameDictionaryRegex_, output);
            }
            stats.persons += applyPerson(titledNameRegex_, output);
            stats.persons += applyPerson(firstLastRegex_, output);
            stats.persons += applyPerson(capitalSequenceRegex_, output);
        }

        if (!skip.contains(Category::Date)) {
            stats.dates = apply(dateRegex_, output, config::kDateToken);
        }

        if (!skip.contains(Category::RelativeDate)) {
            stats.relativeDates = apply(relativeDateRegex_, output, config::kRelativeDateToken);
        }

        result.text = tidier_.tidy(output);
        util::logger::debug("Scrubber: " + std::to_string(stats.total()) +
                            " redactions in note of " + std::to_string(input.size()) + " bytes");
        return result;
    }

    std::size_t mrnMinLength() const { return mrnMinLength_; }
    std::size_t mrnMaxLength() const { return mrnMaxLength_; }

    /// Merged name dictionary (defaults plus configured names), sorted.
    const std::vector<std::string> &nameTerms() const { return nameTerms_; }

    /// Merged facility dictionary (defaults plus configured keywords), sorted.
    const std::vector<std::string> &facilityTerms() const { return facilityTerms_; }

private:
    static std::size_t apply(const std::regex &re, std::string &text, const char *token)
    {
        ReplaceResult r = replaceAll(re, text, token);
        text.swap(r.text);
        return r.count;
    }

    static std::size_t applyPerson(const std::regex &re, std::string &text)
    {
        ReplaceResult r = replaceMatches(re, text, config::kPersonToken, acceptPersonCandidate);
        text.swap(r.text);
        return r.count;
    }

    /**
     * Facility prefix (Saint, Mount, University, ...) + one to five capitalized
     * words + an optional facility-type suffix. The prefix and suffix match in
     * any case, the words must be capitalized.
     */
    static std::string buildFacilityPattern()
    {
        using pattern::anyCaseLiteral;
        const std::string prefix = pattern::alternation({
            anyCaseLiteral("St."), anyCaseLiteral("Saint"), anyCaseLiteral("Mt."),
            anyCaseLiteral("Mount"), anyCaseLiteral("Univ."), anyCaseLiteral("University"),
            anyCaseLiteral("Memorial"),
            anyCaseLiteral("Children") + pattern::apostropheClass() + "?" + anyCaseLiteral("s"),
            anyCaseLiteral("General"), anyCaseLiteral("County"),
        });
        const std::string word =
            "[A-Z]" + pattern::bounded(R"([A-Za-z0-9\x80-\xff'.\-])", 1, pattern::kMaxWordRun);
        const std::string suffix = pattern::alternation({
            anyCaseLiteral("Hospital"),
            anyCaseLiteral("Med") + "(?:" + anyCaseLiteral("ical") + ")?" +
                pattern::optionalSpaces() + anyCaseLiteral("Center"),
            anyCaseLiteral("Clinic"),
            anyCaseLiteral("Health") + "(?:" + anyCaseLiteral("care") + ")?",
            anyCaseLiteral("Infirmary"),
        });
        const std::string sp = pattern::spaces();
        return R"(\b)" + prefix + sp + word + "(?:" + sp + word + "){0,4}" + "(?:" + sp + suffix +
               ")?" + R"(\b)";
    }

    /**
     * House number + one to five capitalized words + street type, with an
     * optional unit suffix. An abbreviated street type does not swallow a
     * following period.
     */
    static std::string buildAddressPattern()
    {
        std::vector<std::string> types;
        for (const char *t : {"Street", "Avenue", "Road", "Drive", "Boulevard", "Lane", "Court",
                              "Place", "Terrace", "Way", "Blvd", "Ave", "Ter", "St", "Rd", "Dr",
                              "Ln", "Ct", "Pl"}) {
            types.push_back(pattern::anyCaseLiteral(t));
        }
        const std::string unit = pattern::alternation(
            {pattern::anyCaseLiteral("Apt"), pattern::anyCaseLiteral("Unit"), "#"});
        const std::string sp = pattern::spaces();
        const std::string osp = pattern::optionalSpaces();
        const std::string word = "[A-Z]" + pattern::bounded(R"([\w.\-])", 0, pattern::kMaxWordRun);
        return R"(\b\d{1,6})" + sp + "(?:" + word + sp + "){1,5}" + pattern::alternation(types) +
               R"(\b(?:\.?)" + osp + unit + R"(\.?)" + osp + R"(\w{1,16})?)";
    }

    /**
     * Honorific (Dr., Mrs., Rev., Officer, ...) + one or two capitalized words.
     */
    static std::string buildTitledNamePattern()
    {
        std::vector<std::string> titles;
        for (const auto &t : config::honorificTitles()) {
            titles.push_back(pattern::anyCaseLiteral(t));
        }
        const std::string word = pattern::capitalizedWord();
        const std::string sp = pattern::spaces();
        return R"(\b)" + pattern::alternation(titles) + R"(\.?)" + sp + word + "(?:" + sp + word +
               ")?";
    }

    /**
     * Common first name + one or two capitalized words.
     */
    static std::string buildFirstLastPattern()
    {
        std::vector<std::string> firsts;
        for (const auto &n : config::commonFirstNames()) {
            firsts.push_back(pattern::anyCaseLiteral(n));
        }
        const std::string word = pattern::capitalizedWord();
        const std::string sp = pattern::spaces();
        return R"(\b)" + pattern::alternation(firsts) + sp + word + "(?:" + sp + word + ")?";
    }

    // Two or three consecutive capitalized words.
    static std::string buildCapitalSequencePattern()
    {
        const std::string word = pattern::capitalizedWord();
        const std::string sp = pattern::spaces();
        return R"(\b)" + word + sp + word + "(?:" + sp + word + R"()?\b)";
    }

    static std::string buildDatePattern()
    {
        const std::string month =
            R"((?:Jan|Feb|Mar|Apr|May|Jun|Jul|Aug|Sept|Sep|Oct|Nov|Dec)[a-z]{0,9}\.?)";
        const std::string sp = pattern::spaces();
        return R"(\b(?:)"
               R"(\d{4}-\d{2}-\d{2}|)"
               R"(\d{1,2}/\d{1,2}(?:/\d{2,4})?|)"
               R"(\d{1,2}-\d{1,2}-\d{2,4}|)" +
               month + sp + R"(\d{1,2}(?:st|nd|rd|th)?,?)" + sp + R"(\d{2,4}|)" +
               R"(\d{1,2})" + sp + month + ",?" + sp + R"(\d{2,4})"
               R"()\b)";
    }

    std::size_t mrnMinLength_;
    std::size_t mrnMaxLength_;

    std::vector<std::string> nameTerms_;
    std::vector<std::string> facilityTerms_;

    std::regex emailRegex_;
    std::regex phoneRegex_;
    std::regex ssnRegex_;
    std::regex mrnLabelRegex_;
    std::regex mrnRegex_;
    std::regex zipRegex_;
    std::regex facilityRegex_;
    std::optional<std::regex> customFacilityRegex_;
    std::regex addressRegex_;
    std::regex coordinateRegex_;
    std::optional<std::regex> nameDictionaryRegex_;
    std::regex titledNameRegex_;
    std::regex firstLastRegex_;
    std::regex capitalSequenceRegex_;
    std::regex dateRegex_;
    std::regex relativeDateRegex_;

    PunctuationTidier tidier_;
};

} // namespace scrubber
} // namespace clinscrub

#endif // CLINSCRUB_SCRUBBER_SCRUBBER_HPP
