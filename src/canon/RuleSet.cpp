#include "canon/RuleSet.hpp"

namespace canon {

RuleSet default_rules() {
    RuleSet r;

    r.modifiers = {
        // fat
        "low-fat", "low fat", "lowfat", "reduced-fat", "reduced fat",
        "fat-free", "fat free", "nonfat", "non-fat",
        // sodium
        "low-sodium", "low sodium", "reduced-sodium", "reduced sodium",
        "sodium-free", "sodium free",
        // grade
        "extra-virgin", "extra virgin",
        "lite", "light", "reduced", "part-skim", "part skim", "plain",
        // brands
        "kirkland", "365", "great value", "member's mark", "store brand", "organic",
    };

    r.varietals = {
        {"apple", {"granny smith", "gala", "fuji", "honeycrisp", "red delicious",
                   "golden delicious", "pink lady", "braeburn", "mcintosh", "tart"}},
        {"potato", {"russet", "yukon gold"}},
    };

    r.prep_adverbs = {
        "finely", "coarsely", "freshly", "thinly", "thickly", "roughly", "lightly",
    };

    r.prep_words = {
        // preparation
        "chopped", "sliced", "diced", "minced", "grated", "shredded", "crushed",
        "ground", "whole",
        // state
        "fresh", "dried", "frozen", "canned", "raw", "roasted", "toasted",
        "cooked", "prepared", "uncooked",
        "instant", "quick-cooking", "rapid-rise", "ready-to-eat",
        "peeled", "seeded", "trimmed", "drained", "rinsed", "scrubbed",
        "halved", "quartered", "pitted", "cubed",
        // notes
        "divided", "plus more", "to taste", "optional", "if desired", "if needed",
    };

    r.container_nouns = {
        "bunch", "sprig", "sprigs", "leaves", "leaf", "clove", "cloves",
        "head", "heads", "piece", "pieces",
        "pinch", "dash", "envelope", "can", "jar", "package", "box", "container",
    };

    r.units = {
        "cups", "cup", "tablespoons", "tablespoon", "teaspoons", "teaspoon",
        "tbsp", "tsp", "fl oz", "oz", "ounces", "ounce", "lbs", "lb",
        "pounds", "pound", "kg", "grams", "gram", "g", "ml", "liters", "liter",
        "quarts", "quart", "pints", "pint", "gallons", "gallon",
    };

    r.header_prefixes = {"For "};
    r.header_markers = {"Ingredient", "Topping:", "Salad:", "Dressing:"};
    r.fragment_prefixes = {"s)"};
    r.junk_exact = {
        "to medium",
        "fresh", "grated", "chopped", "sliced", "diced", "en", "canned",
        "cubed", "halved", "quartered",
    };
    r.equipment = {
        "aluminum foil", "foil", "bamboo skewers", "skewers", "toothpicks",
        "popsicle sticks", "craft sticks", "parchment", "wax paper", "paper towel",
    };
    r.note_prefixes = {"note:"};
    r.note_markers = {
        "optional toppings", "necessary tools", "to reduce browning", "adjust to taste",
    };

    return r;
}

const char* or_alternative_str(OrAlternative o) {
    switch (o) {
        case OrAlternative::KeepFirst: return "keep_first";
        case OrAlternative::KeepLast: return "keep_last";
        default: return "unknown";
    }
}

}  // namespace canon
