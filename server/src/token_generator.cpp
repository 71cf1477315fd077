#include "bytebeam/server/token_generator.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <utility>

#include "bytebeam/crypto.hpp"

namespace bytebeam::server
{

    namespace
    {
        constexpr std::string_view kNumber = "{number}";
        constexpr std::string_view kWord = "{word}";
        constexpr std::string_view kUuid = "{uuid}";
        constexpr std::uint32_t kNumberRange = 100;

        constexpr std::array<std::string_view, 1129> kBuiltinWords{{
            "abacus", "abbey", "about", "above", "accent", "acid", "acorn", "acre", "acrobat", "actor",
            "adagio", "admiral", "adobe", "adult", "agate", "agent", "airship", "aisle", "alarm", "album",
            "alcove", "alert", "alley", "alloy", "almond", "aloe", "alpha", "alpine", "altar", "amber",
            "amethyst", "amigo", "ample", "amulet", "anchor", "angle", "ankle", "anthem", "antler", "anvil",
            "apple", "apricot", "april", "apron", "aqua", "aquarium", "arbor", "arcade", "arch", "archer",
            "arctic", "ardent", "arena", "argon", "armadillo", "armor", "aroma", "arrow", "artist", "ash",
            "aside", "aspen", "asteroid", "astro", "atlas", "atom", "attic", "audio", "aurora", "autumn",
            "avenue", "avocado", "axis", "azure", "backpack", "bacon", "badge", "badger", "bagel", "baker",
            "bakery", "balcony", "ballad", "ballet", "balsa", "bamboo", "banana", "band", "bandana", "banjo",
            "banner", "barley", "barn", "barnacle", "baron", "barrel", "basalt", "basil", "basin", "basket",
            "bass", "batch", "bay", "bayou", "beach", "beacon", "bead", "beagle", "beam", "bean", "bear",
            "beaver", "bee", "beetle", "beetroot", "belfry", "bell", "belt", "bench", "beret", "berry",
            "bicycle", "billow", "binder", "birch", "bird", "biscuit", "bishop", "bison", "bistro", "blade",
            "blanket", "blaze", "blend", "blender", "blimp", "blink", "block", "bloom", "blossom", "blue",
            "bluebell", "bluff", "board", "boat", "bobcat", "bobsled", "bolt", "bone", "bonfire", "bonsai",
            "bonus", "book", "bookcase", "boot", "border", "boulder", "boulevard", "bouquet", "bow", "bowl",
            "box", "bracelet", "bramble", "branch", "brass", "brave", "bread", "breadbox", "breeze", "brick",
            "bridge", "brim", "brisket", "brocade", "bronze", "brook", "broom", "brownie", "brush", "bubble",
            "bucket", "buckle", "buckwheat", "bud", "buffalo", "buggy", "bugle", "bulb", "bulldog", "bumblebee",
            "bungalow", "bunny", "buoy", "burrito", "burrow", "butter", "button", "buzzard", "cabbage", "cabin",
            "cable", "cactus", "cafe", "cake", "calico", "calm", "camel", "camellia", "camera", "camp",
            "campfire", "canal", "canary", "candle", "candor", "candy", "cannon", "canoe", "canvas", "canyon",
            "cape", "capsule", "caramel", "caravan", "carbon", "card", "cardinal", "cargo", "carol", "carousel",
            "carpet", "carrot", "cart", "cascade", "cashew", "castle", "cat", "catalog", "cathedral",
            "cauldron", "cavalry", "cave", "cavern", "cedar", "celery", "cello", "cement", "cereal", "chair",
            "chalk", "chamomile", "chandelier", "channel", "chapel", "chapter", "charcoal", "chariot", "charm",
            "cheese", "cheetah", "cherry", "chess", "chest", "chestnut", "chick", "chickpea", "chili", "chime",
            "chimney", "chip", "choir", "chowder", "cider", "cinder", "cinnamon", "circle", "citrus", "city",
            "clam", "clarinet", "clay", "cliff", "clipper", "clock", "clockwork", "cloth", "cloud",
            "cloudburst", "clover", "clown", "coach", "coast", "cobalt", "cobbler", "cobra", "cockatoo",
            "cocoa", "coconut", "coffee", "coin", "collar", "colt", "comet", "compass", "concert", "conch",
            "condor", "cookie", "copper", "coral", "cord", "cork", "corn", "corridor", "cosmic", "cosmos",
            "cottage", "cotton", "couch", "cougar", "courtyard", "cove", "cowbell", "cowboy", "coyote", "crab",
            "cradle", "cranberry", "crane", "crater", "crayon", "creek", "crescent", "crest", "cricket",
            "crisp", "crocus", "croissant", "crow", "crown", "crumb", "crystal", "cube", "cubic", "cucumber",
            "cup", "cupcake", "cupola", "curry", "curtain", "cushion", "cutlass", "cyan", "cycle", "cypress",
            "dagger", "dahlia", "dairy", "daisy", "damask", "dance", "dandelion", "dawn", "daybreak", "decoy",
            "deer", "delta", "denim", "depot", "desert", "desk", "dew", "diamond", "diary", "dinghy", "dingo",
            "dinner", "disco", "dock", "dolphin", "dome", "domino", "donkey", "door", "doorbell", "dove",
            "dover", "dovetail", "dragon", "drawbridge", "dream", "drift", "driftwood", "drum", "duck",
            "dumpling", "dune", "dust", "eagle", "earth", "easel", "echo", "eclipse", "eel", "egg", "eggplant",
            "elbow", "elder", "elephant", "elixir", "elk", "elm", "embassy", "ember", "emblem", "emerald",
            "enamel", "engine", "envoy", "epoch", "equal", "espresso", "evening", "fable", "fabric", "fairway",
            "fairy", "falcon", "fang", "farm", "feast", "feather", "fence", "fennel", "fern", "ferret", "ferry",
            "festival", "fiddle", "field", "fiesta", "fig", "filament", "finch", "fir", "fire", "firefly",
            "fish", "fjord", "flag", "flagpole", "flame", "flamingo", "flannel", "flapjack", "flask", "fleet",
            "flicker", "flint", "flock", "flora", "flotilla", "flower", "flute", "foam", "focus", "fog", "folk",
            "fondue", "footpath", "forest", "forge", "fossil", "fountain", "fox", "foxglove", "frame",
            "freckle", "fridge", "frigate", "frog", "frost", "fruit", "fudge", "funnel", "gadget", "galaxy",
            "galleon", "gallery", "garden", "garland", "garlic", "garnet", "gate", "gateway", "gazelle",
            "gecko", "gem", "geyser", "ghost", "giant", "ginger", "gingham", "glacier", "glade", "glass",
            "glider", "glimmer", "globe", "glove", "glow", "goat", "goblet", "gold", "gondola", "goose",
            "gopher", "gorilla", "gourd", "grain", "granite", "granola", "grape", "grass", "gravel", "gravy",
            "griffin", "grizzly", "grove", "guava", "guide", "guitar", "gull", "gum", "gumdrop", "habit",
            "hail", "halo", "hammer", "hammock", "hamster", "handle", "harbor", "harp", "harvest", "hat",
            "hatchet", "haven", "hawk", "hay", "hazel", "hazelnut", "hearth", "heather", "hedge", "hedgehog",
            "heirloom", "helix", "helmet", "hemlock", "hen", "herb", "heritage", "heron", "hibiscus", "hickory",
            "highland", "hill", "hillside", "hippo", "hive", "hollow", "holly", "homestead", "honey",
            "honeycomb", "hook", "hoop", "hopscotch", "horizon", "horn", "hornet", "horse", "hotel", "hound",
            "huckleberry", "hummus", "hut", "hyacinth", "ice", "icicle", "igloo", "iguana", "image", "index",
            "ink", "inkwell", "inlet", "iris", "iron", "island", "isthmus", "ivory", "ivy", "jackal", "jacket",
            "jade", "jaguar", "jam", "jamboree", "jar", "jasmine", "javelin", "jazz", "jeep", "jelly", "jester",
            "jet", "jewel", "jigsaw", "joker", "jubilee", "juice", "jukebox", "jungle", "juniper", "kale",
            "kangaroo", "kayak", "kelp", "kernel", "kestrel", "kettle", "key", "keystone", "kiln", "kingfisher",
            "kitchen", "kite", "kitten", "kiwi", "knapsack", "knot", "koala", "label", "ladder", "lagoon",
            "lake", "lakeside", "lamb", "lamp", "lamplight", "landmark", "lantern", "larch", "lark", "laser",
            "latch", "lattice", "laurel", "lava", "lavender", "lawn", "leaf", "ledge", "leek", "lemon",
            "lemonade", "lemur", "lens", "lentil", "leopard", "lettuce", "library", "lighthouse", "lilac",
            "lime", "limestone", "lindens", "linen", "lion", "lizard", "llama", "lobster", "locket",
            "locomotive", "lodge", "loft", "lollipop", "lotus", "lullaby", "lunar", "lynx", "macaron",
            "mackerel", "magnet", "magnolia", "mallet", "mammoth", "mandolin", "mango", "manor", "mantle",
            "maple", "maracas", "marble", "mare", "marigold", "marina", "market", "marmot", "marsh", "marzipan",
            "mask", "meadow", "meadowlark", "medal", "melody", "melon", "mercury", "meringue", "mesa", "meteor",
            "metro", "metronome", "midnight", "milestone", "minnow", "minstrel", "mint", "mirror", "mist",
            "mistral", "mitten", "moat", "mocha", "molar", "molasses", "mole", "mongoose", "monkey", "monsoon",
            "moon", "moonbeam", "moose", "mosaic", "moss", "moth", "mountain", "mouse", "muffin", "mulberry",
            "mule", "mural", "mushroom", "musket", "nacho", "napkin", "narwhal", "nautilus", "nebula", "nectar",
            "needle", "nest", "net", "nettle", "newt", "nickel", "night", "nightfall", "noble", "nomad",
            "north", "nougat", "novel", "nutmeg", "nutshell", "nylon", "oak", "oar", "oasis", "oat", "oatmeal",
            "obelisk", "oboe", "ocean", "octave", "octopus", "olive", "omelet", "onion", "opera", "orange",
            "orbit", "orchard", "orchid", "organ", "oriole", "osprey", "ostrich", "otter", "outpost", "owl",
            "oyster", "paddle", "pagoda", "paint", "paisley", "palette", "palm", "pancake", "panda", "panther",
            "papaya", "paper", "parcel", "parrot", "parsley", "pasta", "path", "pavilion", "peach", "peacock",
            "peak", "peanut", "pear", "pearl", "pebble", "pecan", "pelican", "pen", "pencil", "pendant",
            "penguin", "pepper", "peppermint", "pepperoni", "perch", "periwinkle", "petal", "pheasant", "piano",
            "piccolo", "pickle", "pier", "pigeon", "pigment", "pillow", "pilot", "pine", "pinecone", "pinwheel",
            "pipe", "pistachio", "pixel", "planet", "plank", "plateau", "platypus", "plaza", "plum", "pocket",
            "polar", "pollen", "pond", "pony", "poppy", "porcelain", "porch", "porcupine", "postcard", "potato",
            "pottery", "prairie", "pretzel", "primrose", "prism", "puffin", "pumpkin", "puppy", "puzzle",
            "pyramid", "quail", "quarry", "quartz", "quest", "quilt", "quilted", "quince", "quiver", "quokka",
            "rabbit", "raccoon", "radar", "radish", "raft", "rain", "rainbow", "raisin", "rampart", "ranch",
            "rapids", "raspberry", "rattan", "raven", "rawhide", "redwood", "reed", "reef", "regatta",
            "reindeer", "rhubarb", "ribbon", "rice", "riddle", "ridge", "ring", "river", "rivulet", "road",
            "robin", "rocket", "rooftop", "rose", "rosemary", "rowboat", "royal", "ruby", "rudder", "rug",
            "saddle", "saffron", "sage", "sail", "salmon", "salsa", "sand", "sandal", "sandbar", "sapling",
            "sapphire", "satchel", "satin", "sauce", "savanna", "scallop", "scarecrow", "scarf", "school",
            "scone", "sea", "seahorse", "seal", "seashell", "seed", "sequoia", "sextant", "shadow", "shamrock",
            "sheep", "shell", "sherbet", "sherpa", "shingle", "shore", "shrimp", "silk", "silver", "sky",
            "skylark", "skyline", "sled", "slipper", "slope", "snail", "snow", "snowflake", "soap", "sock",
            "sofa", "solar", "sonnet", "sparrow", "spice", "spindle", "spoon", "spring", "sprocket", "spruce",
            "squid", "squirrel", "stallion", "star", "starfish", "steam", "steeple", "stone", "stork", "storm",
            "straw", "stream", "sugar", "summit", "sun", "sundial", "sunflower", "sunrise", "swallow", "swan",
            "sweater", "table", "taco", "tadpole", "tambourine", "tangerine", "tango", "tapestry", "tartan",
            "tea", "teacup", "teakettle", "teapot", "telescope", "tent", "terrace", "thimble", "thistle",
            "thrush", "thunder", "thyme", "tide", "tiger", "timber", "tinsel", "toadstool", "toast", "toboggan",
            "toffee", "tomato", "topaz", "topsoil", "torch", "toucan", "tower", "trail", "train", "trapeze",
            "tree", "treetop", "trellis", "trinket", "trombone", "trout", "truck", "trumpet", "tugboat",
            "tulip", "tulipwood", "tuna", "tundra", "turban", "turkey", "turnip", "turquoise", "turtle", "twig",
            "umbrella", "unicorn", "upland", "vagabond", "valley", "van", "vanilla", "vapor", "velvet",
            "veranda", "verbena", "vessel", "village", "vine", "vineyard", "violet", "violin", "volcano",
            "vulture", "waffle", "wagon", "walnut", "walrus", "wand", "warbler", "watchtower", "waterfall",
            "wave", "wax", "weasel", "weathervane", "whale", "wheat", "wheel", "wheelbarrow", "whirlwind",
            "whistle", "wicker", "wildfire", "willow", "wind", "windmill", "window", "wisteria", "wolf",
            "wombat", "wood", "woodland", "wool", "wren", "yacht", "yak", "yarn", "yellow", "yeti", "yogurt",
            "zebra", "zenith", "zephyr", "zinc", "zipper", "zucchini",
        }};

        std::string_view trim(std::string_view value)
        {
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
            {
                value.remove_prefix(1);
            }
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
            {
                value.remove_suffix(1);
            }
            return value;
        }

    } // namespace

    std::vector<std::string> load_wordlist(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Failed to open wordlist: " + path.string());
        }
        std::vector<std::string> words;
        std::string line;
        while (std::getline(in, line))
        {
            const auto word = trim(line);
            if (!word.empty())
            {
                words.emplace_back(word);
            }
        }
        if (words.empty())
        {
            throw std::runtime_error("Wordlist is empty: " + path.string());
        }
        return words;
    }

    const std::vector<std::string> &builtin_wordlist()
    {
        static const std::vector<std::string> words(kBuiltinWords.begin(), kBuiltinWords.end());
        return words;
    }

    TokenGenerator::TokenGenerator(std::vector<std::string> words)
        : words_(std::move(words))
    {
        if (words_.size() > std::numeric_limits<std::uint32_t>::max())
        {
            throw std::invalid_argument("Wordlist is too large");
        }
    }

    void TokenGenerator::validate_format(std::string_view format) const
    {
        if (format.empty())
        {
            throw std::invalid_argument("Token format must not be empty");
        }
        if (format.find(kWord) != std::string_view::npos && words_.empty())
        {
            throw std::invalid_argument("Token format uses {word} but the wordlist is empty");
        }
        if (format.find('/') != std::string_view::npos || format.find('?') != std::string_view::npos)
        {
            throw std::invalid_argument("Token format must not contain '/' or '?'");
        }
    }

    std::string TokenGenerator::generate(std::string_view format) const
    {
        std::string output;
        output.reserve(format.size() * 2);
        std::size_t cursor = 0;
        while (cursor < format.size())
        {
            const auto rest = format.substr(cursor);
            if (rest.starts_with(kNumber))
            {
                output += std::to_string(crypto::random_below(kNumberRange));
                cursor += kNumber.size();
            }
            else if (rest.starts_with(kWord))
            {
                if (words_.empty())
                {
                    throw std::invalid_argument("Token format uses {word} but the wordlist is empty");
                }
                output += words_[crypto::random_below(static_cast<std::uint32_t>(words_.size()))];
                cursor += kWord.size();
            }
            else if (rest.starts_with(kUuid))
            {
                output += crypto::random_uuid();
                cursor += kUuid.size();
            }
            else
            {
                output.push_back(format[cursor]);
                ++cursor;
            }
        }
        return output;
    }

} // namespace bytebeam::server
