#include <labelscan/text/dictionaries.hpp>
#include <unordered_map>
#include <unordered_set>

namespace labelscan::text {

namespace {

constexpr std::string_view kStreetTypes[] = {
    "boulevard", "lotissement", "residence", "lieu-dit", "lieudit", "passage",
    "impasse",   "chemin",      "avenue",    "square",   "hameau",  "allee",
    "place",     "route",       "cours",     "quai",     "voie",    "rue",
    "bld",       "rte",         "ate",       "av",       "bd",
    "imp",
};

constexpr std::string_view kStreetTypesMajor[] = {
    "rue", "avenue", "boulevard", "allee", "impasse", "chemin",
};

constexpr std::string_view kLegalForms[] = {
    "auto-entrepreneur", "micro-entreprise", "selarl", "selafa", "selas", "sasu",
    "sarl", "eurl", "scop", "earl", "gaec", "eirl", "sas", "sci", "snc", "scp",
    "gie", "sa", "ei",
};

constexpr std::string_view kBusinessKeywords[] = {
    "restaurant", "brasserie", "cafe", "bar", "bistrot", "boulangerie",
    "patisserie", "traiteur", "pharmacie", "parapharmacie", "laboratoire",
    "labo", "garage", "carrosserie", "concession", "hotel", "gite", "camping",
    "coiffure", "salon", "institut", "spa", "beaute", "supermarche",
    "epicerie", "magasin", "boutique", "shop", "store", "cabinet", "clinique",
    "centre", "agence", "atelier", "usine", "entrepot", "depot", "banque",
    "assurance", "mutuelle", "ecole", "lycee", "college", "universite",
    "mairie", "prefecture", "tribunal", "entreprise", "societe", "ets",
    "etablissement", "cie", "compagnie", "group", "groupe", "holding",
    "association", "fondation", "federation",
};

constexpr std::string_view kAnnexKeywords[] = {
    "appartement", "lotissement", "interphone", "residence", "apartment",
    "batiment", "building", "pavillon", "digicode", "lieu-dit", "immeuble",
    "escalier", "chateau", "bureaux", "offices", "lieudit", "bureau",
    "office", "appart", "maison", "hameau", "entree", "etage", "villa",
    "porte", "block", "tower", "zone", "appt", "bloc", "tour", "code",
    "bat", "apt", "imm", "lot", "res", "ent", "esc", "pte", "pav", "zac",
    "za", "zi", "ld", "rdc",
};

constexpr std::string_view kCivilities[] = {
    "mademoiselle", "monsieur", "madame", "mlle", "mme", "mr", "mm", "m", "dr",
    "me",
};

constexpr std::string_view kNameExclusions[] = {
    "rue", "avenue", "boulevard", "allee", "impasse", "chemin", "av", "bd",
    "bld", "place", "route", "passage", "square", "cours", "quai", "voie",
    "residence", "lotissement", "france", "cedex", "bp", "cs", "tel",
    "telephone", "mobile", "portable", "fax", "email", "mail", "www", "http",
    "livraison", "expediteur", "destinataire", "colis", "commande", "ref",
    "reference", "numero", "poids", "kg", "tracking", "shipment", "contact",
    "signature",
};

constexpr std::string_view kInlineNameExclusions[] = {
    "ups", "dhl", "dpd", "gls", "fra", "eur", "cod", "edi", "standard",
    "tracking", "billing", "cheque", "paiement", "reference", "ship", "mont",
    "france", "lyon", "paris", "rue", "avenue", "route", "boulevard", "place",
    "chemin", "allee", "impasse", "cedex", "contact", "net", "capital",
    "weight", "date", "saver", "racking", "predict", "prep", "colis", "tra",
    "ret", "into", "poids", "tous", "moyens", "acceptes", "nante", "contad",
    "whatsapp", "zoom", "highlight", "view", "image", "terrene", "tertent",
    "tel", "telephone", "livraison", "destinataire",
};

constexpr std::string_view kPhoneKeywords[] = {
    "telephone", "portable", "contact", "mobile", "numero", "phone", "tel",
};

constexpr std::string_view kCarrierNames[] = {
    "ups", "dhl", "dpd", "gls", "fedex", "tnt", "chronopost", "colissimo",
    "geodis", "laposte", "mondial relay", "relais colis", "colis prive",
};

constexpr std::string_view kCityExclusions[] = {
    "notes", "remarques", "bonjour", "merci", "today", "days", "telephone",
    "tel", "phone", "portable", "mobile", "numero", "zero", "liquid", "cycle",
    "destinataire", "expediteur", "livraison",
};

constexpr std::string_view kStableKeywords[] = {
    "reception", "expedition", "colis", "livraison", "kg", "ship", "rue",
    "avenue", "boulevard", "bd", "av", "place", "allee", "chemin", "impasse",
    "passage", "route", "voie", "cedex", "bp", "cs", "sarl", "sas", "eurl",
    "sa", "sci", "to", "from",
};

}  // namespace

std::span<const std::string_view> street_types() noexcept { return kStreetTypes; }
std::span<const std::string_view> street_types_major() noexcept { return kStreetTypesMajor; }
std::span<const std::string_view> company_legal_forms() noexcept { return kLegalForms; }
std::span<const std::string_view> company_business_keywords() noexcept { return kBusinessKeywords; }
std::span<const std::string_view> annex_keywords() noexcept { return kAnnexKeywords; }
std::span<const std::string_view> civilities() noexcept { return kCivilities; }
std::span<const std::string_view> name_exclusion_words() noexcept { return kNameExclusions; }
std::span<const std::string_view> inline_name_exclusions() noexcept { return kInlineNameExclusions; }
std::span<const std::string_view> phone_keywords() noexcept { return kPhoneKeywords; }
std::span<const std::string_view> carrier_names() noexcept { return kCarrierNames; }
std::span<const std::string_view> city_exclusion_words() noexcept { return kCityExclusions; }
std::span<const std::string_view> stable_keywords() noexcept { return kStableKeywords; }

bool is_common_first_name(std::string_view lower_word) {
  static const std::unordered_set<std::string_view> names = {
      // male
      "jean", "pierre", "michel", "philippe", "alain", "patrick", "nicolas",
      "christophe", "david", "laurent", "thomas", "julien", "eric", "francois",
      "frederic", "olivier", "pascal", "bruno", "didier", "stephane", "thierry",
      "bernard", "jacques", "daniel", "marc", "paul", "louis", "antoine",
      "alexandre", "maxime", "lucas", "hugo", "theo", "nathan", "leo",
      "mohamed", "ahmed", "karim", "mehdi", "youssef", "omar", "ali", "malek",
      "amine", "khalid", "rachid", "said", "nabil", "etienne", "guillaume",
      "sebastien", "vincent", "romain", "arnaud", "gilles", "yves", "henri",
      // female
      "marie", "sophie", "nathalie", "isabelle", "catherine", "sylvie", "anne",
      "christine", "monique", "francoise", "valerie", "sandrine", "celine",
      "veronique", "patricia", "martine", "julie", "camille", "lea", "emma",
      "chloe", "sarah", "laura", "manon", "oceane", "fatima", "amina",
      "fabienne", "corinne", "brigitte", "dominique", "florence", "laurence",
      "stephanie", "aurelie", "elodie", "melanie", "adrienne", "vivienne",
      "julienne", "christiane", "mariane", "marianne", "suzanne", "jeanne",
      "liliane", "helene", "claire", "agnes", "caroline", "emilie",
      // frequent misreadings seen on labels
      "tarienne", "renne", "lansard", "langard", "landard",
  };
  return names.contains(lower_word);
}

std::string_view ocr_correction(std::string_view lower_word) {
  static const std::unordered_map<std::string_view, std::string_view> corrections = {
      // street types
      {"avenve", "avenue"}, {"avenuc", "avenue"}, {"aveune", "avenue"},
      {"avenu", "avenue"}, {"avcnue", "avenue"}, {"bouleward", "boulevard"},
      {"boulevar", "boulevard"}, {"boulvard", "boulevard"}, {"bculevard", "boulevard"},
      {"chemln", "chemin"}, {"chernin", "chemin"}, {"chemim", "chemin"},
      {"impase", "impasse"}, {"lmpasse", "impasse"}, {"ailee", "allee"},
      {"alee", "allee"}, {"rve", "rue"}, {"ruc", "rue"}, {"piace", "place"},
      {"plaee", "place"}, {"routte", "route"}, {"r0ute", "route"},
      {"resldence", "residence"}, {"lotlssement", "lotissement"},
      // civilities
      {"monsleur", "monsieur"}, {"rnonsieur", "monsieur"}, {"madarne", "madame"},
      {"rnadame", "madame"}, {"mademoiselie", "mademoiselle"}, {"rnme", "mme"},
      // cities and postal words
      {"cedcx", "cedex"}, {"cedx", "cedex"}, {"lyom", "lyon"},
      {"marseile", "marseille"}, {"tou1ouse", "toulouse"}, {"toulousc", "toulouse"},
      {"bordeau", "bordeaux"}, {"nantcs", "nantes"}, {"strasbourq", "strasbourg"},
      {"teiephone", "telephone"}, {"te1", "tel"},
  };
  const auto it = corrections.find(lower_word);
  return it == corrections.end() ? std::string_view{} : it->second;
}

}  // namespace labelscan::text
