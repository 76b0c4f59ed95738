#include "default_panels.hpp"

#include "../core/log.hpp"
#include "registry.hpp"

namespace fuse {
namespace breaker {

namespace {

struct CircuitDef {
    const char* id;
    const char* name;
    const char* description;
    const char* endpoint;   // "" = not probed
};

struct PanelDef {
    const char* id;
    const char* name;
    const char* description;
    const char* icon;
    uint32_t position;
    CircuitCategory category;
    const CircuitDef* circuits;
    size_t circuit_count;
};

constexpr CircuitDef AI_AGENTS[] = {
    {"voice-agent", "Voice Agent", "STT/TTS powered voice interaction", ""},
    {"code-generation-agent", "Code Generation Agent", "Generates code across all supported languages", ""},
    {"backend-agent", "Backend Agent", "API design, database schema, server logic", ""},
    {"frontend-agent", "Frontend Agent", "UI components and client-side rendering", ""},
    {"testing-agent", "Testing Agent", "Test generation, QA validation, coverage analysis", ""},
    {"deploy-agent", "Deploy Agent", "CI/CD, containerization, cloud deployment", ""},
};

constexpr CircuitDef REPOSITORIES[] = {
    {"repo-core", "Core", "Core platform repository", "https://github.com/ACHVMR/SmelterOS"},
};

constexpr CircuitDef INTEGRATIONS[] = {
    {"stripe", "Stripe (Payments)", "Payment processing and subscriptions", "https://api.stripe.com/v1"},
    {"github", "GitHub", "Repository hosting and CI/CD", "https://api.github.com"},
    {"cloudflare-workers", "Cloudflare Workers", "Serverless edge functions", "https://api.cloudflare.com/client/v4"},
    {"postgresql", "PostgreSQL Database", "Primary data persistence", "postgresql://localhost:5432/smelter"},
    {"websocket-service", "WebSocket Service", "Real-time communication layer", "wss://ws.smelter.io"},
};

constexpr CircuitDef VOICE[] = {
    {"elevenlabs-integration", "ElevenLabs Integration", "Primary voice synthesis provider", "https://api.elevenlabs.io/v1"},
    {"scribe-stt", "Scribe STT", "Speech-to-text service", "https://api.elevenlabs.io/v1"},
    {"tts-circuit", "TTS Circuit Breaker", "Text-to-speech output control", "https://api.elevenlabs.io/v1"},
    {"realtime-streaming", "Real-time Streaming", "Low-latency voice streaming", "wss://api.elevenlabs.io/v1/text-to-speech"},
};

constexpr CircuitDef DEPLOYMENT[] = {
    {"docker-registry", "Docker Container Registry", "Container image storage and versioning", "https://registry.smelter.io"},
    {"cloudflare-pages", "Cloudflare Pages", "Static site and frontend hosting", ""},
    {"worker-deployment", "Worker Deployment", "Serverless function deployment", ""},
    {"database-backups", "Database Backups", "Automated PostgreSQL backup system", ""},
    {"health-check-circuit", "Health Check Circuit", "System-wide health monitoring", ""},
};

template<size_t N>
constexpr size_t count_of(const CircuitDef (&)[N]) noexcept { return N; }

constexpr PanelDef PANELS[] = {
    {"ai-agents", "AI Agents Panel", "Voice Agent, Code Gen, Backend, Frontend, Testing, Deploy",
     "robot", 1, CircuitCategory::AI_AGENT, AI_AGENTS, count_of(AI_AGENTS)},
    {"repositories", "Repositories Panel", "Intelligent repository management and sync",
     "folder", 2, CircuitCategory::REPOSITORY, REPOSITORIES, count_of(REPOSITORIES)},
    {"integrations", "External Integrations Panel", "Stripe, GitHub, Cloudflare, PostgreSQL, WebSocket",
     "plug", 3, CircuitCategory::INTEGRATION, INTEGRATIONS, count_of(INTEGRATIONS)},
    {"voice", "Voice & STT/TTS Panel", "Voice integration, Scribe STT, real-time streaming",
     "mic", 4, CircuitCategory::VOICE, VOICE, count_of(VOICE)},
    {"deployment", "Deployment & Infrastructure Panel", "Docker, Cloudflare Pages, Workers, Backups, Health",
     "rocket", 5, CircuitCategory::DEPLOYMENT, DEPLOYMENT, count_of(DEPLOYMENT)},
};

} // namespace

size_t load_default_panels(BreakerRegistry& registry) {
    size_t loaded = 0;

    for (const PanelDef& def : PANELS) {
        PanelDescriptor panel;
        panel.id = def.id;
        panel.name = def.name;
        panel.description = def.description;
        panel.icon = def.icon;
        panel.position = def.position;

        if (!registry.add_panel(panel) && !registry.get_panel(def.id)) {
            continue;
        }

        size_t panel_loaded = 0;
        for (size_t i = 0; i < def.circuit_count; ++i) {
            const CircuitDef& c = def.circuits[i];
            CircuitDescriptor circuit;
            circuit.id = c.id;
            circuit.name = c.name;
            circuit.description = c.description;
            circuit.category = def.category;
            circuit.endpoint = c.endpoint;

            if (registry.add_circuit(def.id, circuit)) {
                panel_loaded++;
            }
        }

        log::info("BRK") << "Panel " << def.position << ": " << def.name
                         << " (" << panel_loaded << " circuits)";
        loaded += panel_loaded;
    }

    return loaded;
}

} // namespace breaker
} // namespace fuse
