// examples/example_battle_odds.cpp — Exact conquest odds for a dice battle between two armies.
//
// Each round the attacker rolls one die per troop beyond the first (at most three),
// the defender one die per troop (at most two). The highest dice are paired off,
// ties go to the defender, and every lost pairing removes one troop.

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <map>
#include <utility>
#include <vector>

#include <ratkit/ratkit.hpp>

namespace {

using ratkit::core::rational;

struct round_outcome {
    int attacker_losses = 0;
    int defender_losses = 0;
    rational probability;
};

std::vector<round_outcome> round_outcomes(int attacker_dice, int defender_dice) {
    std::map<std::pair<int, int>, std::int64_t> counts;
    std::int64_t total = 0;
    std::vector<int> attacker(static_cast<std::size_t>(attacker_dice), 1);
    std::vector<int> defender(static_cast<std::size_t>(defender_dice), 1);

    const std::function<void(std::size_t)> roll = [&](std::size_t position) {
        if (position == attacker.size() + defender.size()) {
            std::vector<int> a = attacker;
            std::vector<int> d = defender;
            std::sort(a.rbegin(), a.rend());
            std::sort(d.rbegin(), d.rend());
            int attacker_losses = 0;
            int defender_losses = 0;
            const std::size_t pairs = std::min(a.size(), d.size());
            for (std::size_t index = 0; index < pairs; ++index) {
                if (a[index] > d[index]) {
                    ++defender_losses;
                } else {
                    ++attacker_losses;
                }
            }
            ++counts[{attacker_losses, defender_losses}];
            ++total;
            return;
        }
        int& face = position < attacker.size() ? attacker[position]
                                               : defender[position - attacker.size()];
        for (int value = 1; value <= 6; ++value) {
            face = value;
            roll(position + 1);
        }
    };
    roll(0);

    std::vector<round_outcome> outcomes;
    for (const auto& [losses, count] : counts) {
        outcomes.push_back({losses.first, losses.second,
                            ratkit::core::reduce(ratkit::core::from_int(count, total))});
    }
    return outcomes;
}

class battle {
  public:
    // Probability that an attacking stack of `attackers` troops wipes out `defenders`.
    rational conquest_probability(int attackers, int defenders) {
        if (defenders == 0) {
            return rational::one();
        }
        if (attackers <= 1) {
            return rational::zero();
        }
        const auto key = std::make_pair(attackers, defenders);
        if (const auto found = memo_.find(key); found != memo_.end()) {
            return found->second;
        }
        rational result;
        for (const auto& outcome : outcomes(std::min(attackers - 1, 3), std::min(defenders, 2))) {
            result += outcome.probability *
                      conquest_probability(attackers - outcome.attacker_losses,
                                           defenders - outcome.defender_losses);
        }
        memo_.emplace(key, result);
        return result;
    }

  private:
    const std::vector<round_outcome>& outcomes(int attacker_dice, int defender_dice) {
        const auto key = std::make_pair(attacker_dice, defender_dice);
        auto found = round_cache_.find(key);
        if (found == round_cache_.end()) {
            found = round_cache_.emplace(key, round_outcomes(attacker_dice, defender_dice)).first;
        }
        return found->second;
    }

    std::map<std::pair<int, int>, std::vector<round_outcome>> round_cache_;
    std::map<std::pair<int, int>, rational> memo_;
};

} // namespace

int main() {
    const auto single = round_outcomes(3, 2);
    std::cout << "one round, 3 attacking dice against 2 defending dice:\n";
    for (const auto& outcome : single) {
        std::cout << "  attacker loses " << outcome.attacker_losses << ", defender loses "
                  << outcome.defender_losses << ": " << outcome.probability << '\n';
    }

    battle odds;
    std::cout << "\nconquest probability, attackers vs defenders\n";
    for (int attackers = 2; attackers <= 6; ++attackers) {
        for (int defenders = 1; defenders <= 3; ++defenders) {
            const rational chance = odds.conquest_probability(attackers, defenders);
            std::cout << "  " << attackers << " vs " << defenders << ": " << chance << '\n';
        }
    }
    return 0;
}
