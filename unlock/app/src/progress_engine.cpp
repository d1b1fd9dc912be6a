#include <unlock/app/progress_engine.hpp>
#include <unlock/core/log.hpp>

namespace unlock::app {

using progress::ProgressState;

namespace {

config::EngineConfig validated(config::EngineConfig config) {
    config.validate();
    return config;
}

} // anonymous namespace

ProgressEngine::ProgressEngine(progress::IKeyValueStore& storage,
                               const content::IContentProvider& content,
                               const core::IClock& clock,
                               config::EngineConfig config,
                               achievements::AchievementCatalog catalog)
    : m_config(validated(std::move(config)))
    , m_catalog(std::move(catalog))
    , m_store(storage, &m_events)
    , m_achievements(m_store, m_catalog, content, clock, &m_events)
    , m_badges(m_store, m_achievements, content, clock, m_config.badges) {}

bool ProgressEngine::load() {
    bool found = m_store.load();

    // Saved progress may satisfy achievements added since it was written
    auto unlocked = m_achievements.evaluate();
    if (!unlocked.empty()) {
        core::log_info("app", "Unlocked {} achievements from saved progress", unlocked.size());
    }
    return found;
}

// ============================================================================
// Points & rank
// ============================================================================

int ProgressEngine::total_points() const {
    return m_store.total_points();
}

rank::Rank ProgressEngine::current_rank() const {
    return rank::rank_for(total_points());
}

std::optional<int> ProgressEngine::points_to_next_rank() const {
    int points = total_points();
    return rank::points_to_next(rank::rank_for(points), points);
}

float ProgressEngine::rank_progress() const {
    int points = total_points();
    return rank::progress_fraction(rank::rank_for(points), points);
}

// ============================================================================
// Badges
// ============================================================================

bool ProgressEngine::has_scholar_badge(const std::string& sub_location_id) const {
    return m_store.has_scholar_badge(sub_location_id);
}

bool ProgressEngine::has_explorer_badge(const std::string& site_id) const {
    return m_store.has_explorer_badge(site_id);
}

bool ProgressEngine::is_self_reported(const std::string& site_id) const {
    return m_store.is_self_reported(site_id);
}

int ProgressEngine::scholar_badge_count() const {
    return m_store.read([](const ProgressState& s) { return static_cast<int>(s.scholar_badges.size()); });
}

int ProgressEngine::explorer_badge_count() const {
    return m_store.read([](const ProgressState& s) { return static_cast<int>(s.explorer_badges.size()); });
}

int ProgressEngine::completed_quiz_count() const {
    return m_store.read([](const ProgressState& s) { return static_cast<int>(s.completed_quizzes.size()); });
}

int ProgressEngine::fully_completed_site_count() const {
    return m_achievements.fully_completed_sites_count();
}

// ============================================================================
// Achievements
// ============================================================================

std::vector<std::string> ProgressEngine::unlocked_achievements() const {
    return m_achievements.unlocked_ids();
}

std::vector<std::string> ProgressEngine::locked_achievements() const {
    return m_achievements.locked_ids();
}

std::optional<std::string> ProgressEngine::next_achievement() const {
    return m_achievements.next_achievement();
}

std::optional<achievements::AchievementNotification> ProgressEngine::current_notification() const {
    return m_achievements.current_notification();
}

void ProgressEngine::dismiss_notification() {
    m_achievements.dismiss_notification();
}

// ============================================================================
// Favorites
// ============================================================================

bool ProgressEngine::toggle_favorite(const std::string& site_id) {
    return m_store.toggle_favorite(site_id);
}

bool ProgressEngine::is_favorite(const std::string& site_id) const {
    return m_store.is_favorite(site_id);
}

std::set<std::string> ProgressEngine::favorite_sites() const {
    return m_store.read([](const ProgressState& s) { return s.favorite_sites; });
}

void ProgressEngine::reset_progress() {
    m_store.reset();
    m_achievements.clear_notifications();
    m_achievements.invalidate_cache();
}

} // namespace unlock::app
