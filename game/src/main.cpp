#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

#include <core/Logger.hpp>
#include <config/Config.hpp>
#include <spatial/OBB.hpp>

#include "building/Builder.hpp"
#include "building/Placeable.hpp"
#include "building/PlaceableCatalog.hpp"
#include "building/PlacementWorld.hpp"
#include "building/ResourceInventory.hpp"

using namespace Lodestone;
using namespace Lodestone::Building;

/**
 * @brief Parse command line arguments
 */
struct CommandLineArgs {
    std::string configPath = "game/config/lodestone.json";
    std::string catalogPath;
    std::string logFile;
    bool verbose = false;
    bool showHelp = false;

    static CommandLineArgs Parse(int argc, char* argv[]) {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i) {
            std::string_view arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                args.showHelp = true;
            } else if (arg == "-c" || arg == "--config") {
                if (i + 1 < argc) {
                    args.configPath = argv[++i];
                }
            } else if (arg == "-k" || arg == "--catalog") {
                if (i + 1 < argc) {
                    args.catalogPath = argv[++i];
                }
            } else if (arg == "-l" || arg == "--log") {
                if (i + 1 < argc) {
                    args.logFile = argv[++i];
                }
            } else if (arg == "-v" || arg == "--verbose") {
                args.verbose = true;
            }
        }

        return args;
    }

    static void PrintHelp() {
        std::cout << "lodestone_demo - scripted building session\n";
        std::cout << "==========================================\n\n";
        std::cout << "Usage: lodestone_demo [options]\n\n";
        std::cout << "Options:\n";
        std::cout << "  -h, --help          Show this help message\n";
        std::cout << "  -c, --config PATH   Configuration file (created with defaults if missing)\n";
        std::cout << "  -k, --catalog PATH  Placeable catalog, overrides demo.catalog\n";
        std::cout << "  -l, --log PATH      Also write the log to a rotating file\n";
        std::cout << "  -v, --verbose       Log state machine transitions\n";
    }
};

namespace {

/**
 * @brief Drives a Builder the way an input layer would, one frame per call
 */
class ScriptedSession {
public:
    ScriptedSession(PlacementWorld& world, Builder& builder, float frameTime)
        : m_world(world), m_builder(builder), m_frameTime(frameTime) {}

    /**
     * @brief Point at @p target and run one frame, optionally pressing confirm
     */
    void Aim(const glm::vec3& target, bool confirm = false, bool isDelete = false) {
        InputState input;
        input.version = ++m_version;
        input.pointerRay = Ray(m_camera, target - m_camera);
        input.isConfirmThisFrame = confirm;
        input.isDelete = isDelete;
        input.hasDeleteStartedThisFrame = isDelete && !m_deleteHeld;
        input.hasDeleteEndedThisFrame = !isDelete && m_deleteHeld;
        m_deleteHeld = isDelete;
        Step(input);
    }

    /**
     * @brief Hover for a few frames so snapping settles, then confirm
     */
    void PlaceAt(const glm::vec3& target) {
        for (int i = 0; i < 3; ++i) {
            Aim(target);
        }
        Aim(target, true);
    }

    void DeleteAt(const glm::vec3& target) {
        Aim(target, false, true);
        Aim(target, true, true);
        Aim(target, false, false);
    }

    void Idle(float seconds) {
        for (float t = 0.0f; t < seconds; t += m_frameTime) {
            InputState input;
            input.version = ++m_version;
            input.pointerRay = Ray(m_camera, glm::vec3(0.0f, 1.0f, 0.0f));
            Step(input);
        }
    }

private:
    void Step(const InputState& input) {
        m_builder.SetInput(input);
        m_builder.Update(m_frameTime);
        m_world.Tick(m_frameTime);
    }

    PlacementWorld& m_world;
    Builder& m_builder;
    float m_frameTime;
    glm::vec3 m_camera{0.0f, 12.0f, -12.0f};
    uint64_t m_version = 0;
    bool m_deleteHeld = false;
};

} // anonymous namespace

/**
 * @brief Headless building session: a foundation row, a post and a beam
 */
int main(int argc, char* argv[]) {
    auto args = CommandLineArgs::Parse(argc, argv);

    if (args.showHelp) {
        CommandLineArgs::PrintHelp();
        return EXIT_SUCCESS;
    }

    Logger::Initialize(args.logFile);

    auto& config = Config::Instance();
    if (!config.Load(args.configPath)) {
        APP_LOG_ERROR("Failed to load configuration from {}", args.configPath);
        Logger::Shutdown();
        return EXIT_FAILURE;
    }

    const std::string level = args.verbose ? "debug" : config.Get<std::string>("logging.level", "info");
    Logger::SetLevel(spdlog::level::from_str(level));

    const std::string catalogPath = args.catalogPath.empty()
        ? config.Get<std::string>("demo.catalog", "game/data/catalog.json")
        : args.catalogPath;

    PlaceableCatalog catalog;
    if (!catalog.LoadFromFile(catalogPath)) {
        APP_LOG_ERROR("Failed to load catalog from {}", catalogPath);
        Logger::Shutdown();
        return EXIT_FAILURE;
    }

    const PlaceableDefinition* foundation = catalog.Find("foundation");
    const PlaceableDefinition* post = catalog.Find("post");
    const PlaceableDefinition* beam = catalog.Find("beam");
    if (!foundation || !post || !beam) {
        APP_LOG_ERROR("Catalog {} lacks the demo placeables", catalogPath);
        Logger::Shutdown();
        return EXIT_FAILURE;
    }

    ResourceInventory inventory;
    inventory.SetCapacity("wood", config.Get<int64_t>("demo.wood_capacity", 100));
    inventory.ForceSet("wood", config.Get<int64_t>("demo.starting_wood", 20));

    PlacementWorld world;
    world.AddSurface(OBB(glm::vec3(0.0f, -0.5f, 0.0f), glm::vec3(50.0f, 0.5f, 50.0f)), Layers::Ground);

    Builder builder(world, inventory, BuilderConfig::FromConfig(config), &catalog);

    int placed = 0;
    int failed = 0;
    builder.SetOnPlacementPerformed([&](const PlacementEvent& event) {
        switch (event.phase) {
            case PlacementPhase::Placed:
                ++placed;
                APP_LOG_INFO("Placed instance {}", event.placeable);
                break;
            case PlacementPhase::PlacementFailed:
            case PlacementPhase::DeletionFailed:
                ++failed;
                APP_LOG_WARN("{}: {}", PlacementPhaseToString(event.phase),
                             PlacementFailureToString(event.failure));
                break;
            case PlacementPhase::Deleted:
                APP_LOG_INFO("Deleted instance {}", event.placeable);
                break;
            case PlacementPhase::Snap:
                APP_LOG_DEBUG("Snapped instance {}", event.placeable);
                break;
            default:
                break;
        }
    });
    builder.SetOnWorldChanged([](const AABB& bounds) {
        APP_LOG_INFO("World changed within ({:.2f}, {:.2f}, {:.2f}) - ({:.2f}, {:.2f}, {:.2f})",
                     bounds.min.x, bounds.min.y, bounds.min.z, bounds.max.x, bounds.max.y, bounds.max.z);
    });
    builder.SetOnToolChanged([](const std::string& assetId) {
        APP_LOG_INFO("Tool: {}", assetId.empty() ? "<none>" : assetId);
    });

    const float frameTime = config.Get<float>("demo.frame_time", 1.0f / 60.0f);
    ScriptedSession session(world, builder, frameTime);

    builder.Start();

    // Two foundations, the second snapping to the first
    builder.SetTool(foundation);
    session.PlaceAt(glm::vec3(0.0f, 0.0f, 0.0f));
    session.PlaceAt(glm::vec3(2.3f, 0.0f, 0.2f));

    // A post on the first foundation's floor grid
    builder.SetTool(post);
    session.PlaceAt(glm::vec3(0.4f, 1.0f, 0.6f));

    // A beam from the post top, two confirms
    builder.SetTool(beam);
    session.PlaceAt(glm::vec3(0.5f, 3.0f, 0.5f));
    session.PlaceAt(glm::vec3(3.0f, 3.0f, 0.5f));

    builder.Cancel();
    session.Idle(0.25f);

    // Remove the post; the beam can float and stays
    session.DeleteAt(glm::vec3(0.5f, 1.5f, 0.5f));
    session.Idle(3.0f);

    APP_LOG_INFO("Session finished: {} placed, {} rejected, {} placeables in the world, {} wood left",
                 placed, failed, world.GetCount(), inventory.GetCount("wood"));

    world.ForEachPlaceable([](const Placeable& placeable) {
        const glm::vec3 p = placeable.GetPosition();
        APP_LOG_INFO("  {} #{} at ({:.2f}, {:.2f}, {:.2f}) connected={}", placeable.GetAssetId(),
                     placeable.GetId(), p.x, p.y, p.z, placeable.IsConnected());
    });

    builder.Shutdown();
    Logger::Shutdown();
    return EXIT_SUCCESS;
}
