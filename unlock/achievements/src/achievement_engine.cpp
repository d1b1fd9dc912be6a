#include <unlock/achievements/achievement_engine.hpp>
#include <unlock/achievements/achievement_events.hpp>
#include <unlock/core/log.hpp>
#include <algorithm>
#include <map>
#include <type_traits>

namespace unlock::achievements {

using progress::ProgressState;

float AchievementProgress::fraction() const {
    if (required <= 0) {
        return 1.0f;
    }
    return std::clamp(static_cast<float>(current) / static_cast<float>(required), 0.0f, 1.0f);
}

// ============================================================================
// Site Completion
// ============================================================================

bool is_site_fully_completed(const ProgressState& state, const content::Site& site) {
    if (!state.has_explorer_badge(site.id)) {
        return false;
    }
    return std::all_of(site.sub_locations.begin(), site.sub_locations.end(),
                       [&](const content::SubLocation& sub) { return state.has_scholar_badge(sub.id); });
}

int count_fully_completed(const ProgressState& state, const std::vector<content::Site>& sites) {
    return static_cast<int>(std::count_if(sites.begin(), sites.end(),
        [&](const content::Site& site) { return is_site_fully_completed(state, site); }));
}

namespace {

template<typename KeyFn>
bool any_group_complete(const ProgressState& state, const std::vector<content::Site>& sites, KeyFn key) {
    // group key -> every site so far fully completed
    std::map<std::string, bool> groups;
    for (const auto& site : sites) {
        bool done = is_site_fully_completed(state, site);
        auto [it, inserted] = groups.emplace(key(site), done);
        if (!inserted) {
            it->second = it->second && done;
        }
    }
    return std::any_of(groups.begin(), groups.end(), [](const auto& entry) { return entry.second; });
}

int counter_value(Counter counter, const ProgressState& state, const std::vector<content::Site>& sites) {
    switch (counter) {
        case Counter::FullyCompletedSites: return count_fully_completed(state, sites);
        case Counter::ScholarBadges:       return static_cast<int>(state.scholar_badges.size());
        case Counter::CorrectQuizzes:      return static_cast<int>(state.completed_quizzes.size());
    }
    return 0;
}

} // anonymous namespace

bool any_city_complete(const ProgressState& state, const std::vector<content::Site>& sites) {
    return any_group_complete(state, sites, [](const content::Site& s) -> const std::string& { return s.city; });
}

bool any_era_complete(const ProgressState& state, const std::vector<content::Site>& sites) {
    return any_group_complete(state, sites, [](const content::Site& s) -> const std::string& { return s.era; });
}

AchievementProgress evaluate_requirement(const AchievementRequirement& requirement,
                                         const ProgressState& state,
                                         const std::vector<content::Site>& sites) {
    return std::visit([&](const auto& req) -> AchievementProgress {
        using T = std::decay_t<decltype(req)>;

        if constexpr (std::is_same_v<T, CountRequirement>) {
            return {counter_value(req.counter, state, sites), std::max(req.target, 1)};
        } else if constexpr (std::is_same_v<T, AllSitesRequirement> ||
                             std::is_same_v<T, FullCompletionRequirement>) {
            // An empty catalog never counts as complete
            int total = static_cast<int>(sites.size());
            return {count_fully_completed(state, sites), std::max(total, 1)};
        } else if constexpr (std::is_same_v<T, CityCompleteRequirement>) {
            return {any_city_complete(state, sites) ? 1 : 0, 1};
        } else {
            return {any_era_complete(state, sites) ? 1 : 0, 1};
        }
    }, requirement);
}

// ============================================================================
// AchievementEngine
// ============================================================================

AchievementEngine::AchievementEngine(progress::ProgressStore& store,
                                     const AchievementCatalog& catalog,
                                     const content::IContentProvider& content,
                                     const core::IClock& clock,
                                     core::EventDispatcher* events)
    : m_store(store)
    , m_catalog(catalog)
    , m_content(content)
    , m_clock(clock)
    , m_events(events)
    , m_content_revision(content.revision()) {}

std::vector<std::string> AchievementEngine::evaluate_in(ProgressState& state, core::Timestamp now) const {
    std::vector<std::string> unlocked;
    auto sites = m_content.sites();

    // One pass is enough: rewards add points, and no requirement reads points
    for (const auto& def : m_catalog.all()) {
        if (state.is_achievement_unlocked(def.achievement_id)) {
            continue;
        }

        auto progress = evaluate_requirement(def.requirement, state, sites);
        if (!progress.is_complete()) {
            continue;
        }

        state.unlocked_achievements.emplace(def.achievement_id, now);
        state.total_points += def.reward_points;
        unlocked.push_back(def.achievement_id);
    }

    return unlocked;
}

void AchievementEngine::announce(const std::vector<std::string>& unlocked_ids) {
    if (unlocked_ids.empty()) {
        return;
    }

    auto now = m_clock.now();
    UnlockCallback on_unlock;
    {
        std::lock_guard<std::mutex> lock(m_notify_mutex);
        for (const auto& id : unlocked_ids) {
            const auto* def = m_catalog.get(id);
            if (!def) continue;

            AchievementNotification notification;
            notification.achievement_id = def->achievement_id;
            notification.display_name = def->display_name;
            notification.message = def->unlocked_description();
            notification.icon = def->icon;
            notification.points = def->reward_points;
            notification.timestamp = now;
            m_notifications.push_back(std::move(notification));
        }
        on_unlock = m_on_unlock;
    }

    for (const auto& id : unlocked_ids) {
        const auto* def = m_catalog.get(id);
        if (!def) continue;

        core::log_info("achievements", "Achievement unlocked: {} (+{} points)",
                       def->display_name, def->reward_points);

        if (on_unlock) {
            on_unlock(*def);
        }

        if (m_events) {
            AchievementUnlockedEvent event;
            event.achievement_id = def->achievement_id;
            event.display_name = def->display_name;
            event.icon = def->icon;
            event.points = def->reward_points;
            event.timestamp = now;
            m_events->dispatch(event);
        }
    }
}

std::vector<std::string> AchievementEngine::evaluate() {
    auto now = m_clock.now();
    auto unlocked = m_store.transact([&](ProgressState& state) {
        return evaluate_in(state, now);
    });
    announce(unlocked);
    return unlocked;
}

// ============================================================================
// Queries
// ============================================================================

AchievementProgress AchievementEngine::progress(const std::string& achievement_id) const {
    const auto* def = m_catalog.get(achievement_id);
    if (!def) {
        return {0, 1};
    }

    auto sites = m_content.sites();
    return m_store.read([&](const ProgressState& state) {
        auto result = evaluate_requirement(def->requirement, state, sites);
        if (state.is_achievement_unlocked(achievement_id)) {
            // Unlocked stays complete even if the site catalog grew since
            result.current = std::max(result.current, result.required);
        }
        return result;
    });
}

float AchievementEngine::progress_percent(const std::string& achievement_id) const {
    return progress(achievement_id).fraction() * 100.0f;
}

bool AchievementEngine::is_unlocked(const std::string& achievement_id) const {
    return m_store.read([&](const ProgressState& state) {
        return state.is_achievement_unlocked(achievement_id);
    });
}

std::optional<core::Timestamp> AchievementEngine::unlock_date(const std::string& achievement_id) const {
    return m_store.read([&](const ProgressState& state) -> std::optional<core::Timestamp> {
        auto it = state.unlocked_achievements.find(achievement_id);
        if (it == state.unlocked_achievements.end()) {
            return std::nullopt;
        }
        return it->second;
    });
}

std::vector<std::string> AchievementEngine::unlocked_ids() const {
    return m_store.read([&](const ProgressState& state) {
        std::vector<std::string> result;
        for (const auto& def : m_catalog.all()) {
            if (state.is_achievement_unlocked(def.achievement_id)) {
                result.push_back(def.achievement_id);
            }
        }
        return result;
    });
}

std::vector<std::string> AchievementEngine::locked_ids() const {
    return m_store.read([&](const ProgressState& state) {
        std::vector<std::string> result;
        for (const auto& def : m_catalog.all()) {
            if (!state.is_achievement_unlocked(def.achievement_id)) {
                result.push_back(def.achievement_id);
            }
        }
        return result;
    });
}

int AchievementEngine::unlocked_count() const {
    return static_cast<int>(unlocked_ids().size());
}

std::vector<std::string> AchievementEngine::by_category(AchievementCategory category) const {
    std::vector<std::string> result;
    for (const auto* def : m_catalog.by_category(category)) {
        result.push_back(def->achievement_id);
    }
    return result;
}

int AchievementEngine::unlocked_in_category(AchievementCategory category) const {
    auto defs = m_catalog.by_category(category);
    return m_store.read([&](const ProgressState& state) {
        return static_cast<int>(std::count_if(defs.begin(), defs.end(),
            [&](const AchievementDefinition* def) { return state.is_achievement_unlocked(def->achievement_id); }));
    });
}

int AchievementEngine::earned_reward_points() const {
    return m_store.read([&](const ProgressState& state) {
        int total = 0;
        for (const auto& def : m_catalog.all()) {
            if (state.is_achievement_unlocked(def.achievement_id)) {
                total += def.reward_points;
            }
        }
        return total;
    });
}

int AchievementEngine::fully_completed_sites_count() const {
    sync_content_revision();
    auto sites = m_content.sites();
    return m_store.read_versioned([&](const ProgressState& state, uint64_t generation) {
        return m_completed_cache.get(generation, [&] { return count_fully_completed(state, sites); });
    });
}

std::optional<std::string> AchievementEngine::next_achievement() const {
    sync_content_revision();
    auto sites = m_content.sites();
    return m_store.read_versioned([&](const ProgressState& state, uint64_t generation) {
        return m_next_cache.get(generation, [&]() -> std::optional<std::string> {
            const AchievementDefinition* best = nullptr;
            float best_fraction = -1.0f;
            for (const auto& def : m_catalog.all()) {
                if (state.is_achievement_unlocked(def.achievement_id)) {
                    continue;
                }
                float fraction = evaluate_requirement(def.requirement, state, sites).fraction();
                if (fraction > best_fraction) {
                    best = &def;
                    best_fraction = fraction;
                }
            }
            if (!best) {
                return std::nullopt;
            }
            return best->achievement_id;
        });
    });
}

void AchievementEngine::invalidate_cache() {
    m_completed_cache.invalidate();
    m_next_cache.invalidate();
}

void AchievementEngine::sync_content_revision() const {
    uint64_t current = m_content.revision();
    if (m_content_revision.exchange(current) != current) {
        core::log_debug("achievements", "Site catalog changed, dropping cached progress");
        m_completed_cache.invalidate();
        m_next_cache.invalidate();
    }
}

// ============================================================================
// Notifications
// ============================================================================

std::optional<AchievementNotification> AchievementEngine::current_notification() const {
    std::lock_guard<std::mutex> lock(m_notify_mutex);
    if (m_notifications.empty()) {
        return std::nullopt;
    }
    return m_notifications.front();
}

void AchievementEngine::dismiss_notification() {
    std::lock_guard<std::mutex> lock(m_notify_mutex);
    if (!m_notifications.empty()) {
        m_notifications.pop_front();
    }
}

bool AchievementEngine::has_pending_notification() const {
    std::lock_guard<std::mutex> lock(m_notify_mutex);
    return !m_notifications.empty();
}

size_t AchievementEngine::pending_notification_count() const {
    std::lock_guard<std::mutex> lock(m_notify_mutex);
    return m_notifications.size();
}

void AchievementEngine::clear_notifications() {
    std::lock_guard<std::mutex> lock(m_notify_mutex);
    m_notifications.clear();
}

void AchievementEngine::set_on_unlock(UnlockCallback callback) {
    std::lock_guard<std::mutex> lock(m_notify_mutex);
    m_on_unlock = std::move(callback);
}

} // namespace unlock::achievements
