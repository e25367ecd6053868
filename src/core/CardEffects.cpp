//
// Created by Malik T on 06/10/2025.
//

#include "CardEffects.hpp"

#include <algorithm>
#include <format>
#include <utility>
#include "Log.hpp"

namespace shadow::core
{
    using RVC = error::RuleViolationCode;

    namespace
    {
        // Deceit: a hidden, unsealed Unknown may answer any vision falsely. It
        // always denies the harmful ones and claims the kind ones.
        auto Deceives(Player const& p) -> bool
        {
            return p.Character() == CharacterId::Unknown && p.Ability().kind == AbilityKind::Static &&
                   !p.AbilityDisabled() && !p.IsRevealed();
        }

        auto Missing(std::string_view what) -> error::RuleViolation
        {
            log::Warn("card resolution: {}", what);
            return error::Viol(RVC::InvalidReference);
        }
    }

    CardResolver::CardResolver(GameSession& session, EventBus& bus, CombatResolver& combat, Dice& dice) :
        session_(session),
        bus_(bus),
        combat_(combat),
        dice_(dice)
    {
    }

    auto CardResolver::Resolve(PlayerId const drawer, CardSP card) -> CardResult
    {
        Player* p = session_.PlayerAt(drawer);
        if (p == nullptr) return std::unexpected(Missing("unknown drawer"));
        if (!card) return std::unexpected(Missing("null card"));

        switch (card->type)
        {
        case CardType::Equipment:
        {
            uint16_t const id = card->id;
            std::string desc = std::format("P{} equips {}", static_cast<int>(drawer), card->name);
            p->Equipment().push_back(std::move(card));
            bus_.Publish(EquipmentChanged{drawer, id, true});
            return CardOutcome{true, std::move(desc), 0};
        }
        case CardType::Vision:
        {
            std::string desc = std::format("P{} holds vision {}", static_cast<int>(drawer), card->name);
            p->Hand().push_back(std::move(card));
            return CardOutcome{true, std::move(desc), 0};
        }
        case CardType::Instant:
        {
            CardResult res = ResolveInstant(*p, *card);
            session_.DiscardCard(std::move(card));
            return res;
        }
        }
        return std::unexpected(error::Viol(RVC::Internal_Unreachable));
    }

    auto CardResolver::ResolveInstant(Player& drawer, Card const& card) -> CardResult
    {
        CardEffect const& eff = card.effect;
        PlayerId const me = drawer.Id();

        switch (eff.kind)
        {
        case EffectKind::Heal:
        {
            int const healed = drawer.Heal(eff.value);
            return CardOutcome{true, std::format("{} heals {}", card.name, healed), healed};
        }

        case EffectKind::RevealAndHealFull:
        {
            if (!RestrictionMatches(eff, drawer.Alignment()))
                return CardOutcome{false, std::format("{} has no effect", card.name), 0};
            if (drawer.Reveal())
                bus_.Publish(CharacterRevealed{me, drawer.Character(), drawer.Alignment(), drawer.Ability().name});
            int const healed = drawer.Heal(drawer.HpMax());
            return CardOutcome{true, std::format("{} reveals and heals {}", card.name, healed), healed};
        }

        case EffectKind::Shield:
            drawer.status.shielded = true;
            return CardOutcome{true, std::format("{} shields P{}", card.name, static_cast<int>(me)), 0};

        case EffectKind::ExtraTurn:
            session_.GrantExtraTurns(static_cast<uint8_t>(std::max(1, eff.value)));
            return CardOutcome{true, std::format("{} grants another turn", card.name), eff.value};

        case EffectKind::DamageOthers:
        {
            int total{};
            for (Player const& other : session_.Players())
            {
                if (other.Id() == me || !other.IsAlive()) continue;
                CombatResult<int> const dealt = combat_.ApplyDamage(me, other.Id(), eff.value, DamageSource::Card);
                if (!dealt) return std::unexpected(dealt.error());
                total += *dealt;
            }
            return CardOutcome{true, std::format("{} deals {} in total", card.name, total), total};
        }

        case EffectKind::DamageArea:
        {
            int const roll = dice_.D6();
            uint8_t const area = board::AreaOf(static_cast<ZoneId>(roll - 1));
            int total{};
            for (Player const& other : session_.Players())
            {
                if (!other.IsAlive() || !other.Position() || board::AreaOf(*other.Position()) != area) continue;
                // Talisman holders ignore damage from the Dark deck.
                if (card.deck == DeckKind::Dark && other.HasEquipment(EffectKind::Ward)) continue;
                CombatResult<int> const dealt = combat_.ApplyDamage(me, other.Id(), eff.value, DamageSource::Card);
                if (!dealt) return std::unexpected(dealt.error());
                total += *dealt;
            }
            return CardOutcome{true, std::format("{} rolls {} and deals {} in area {}", card.name, roll, total, area), total};
        }

        case EffectKind::None:
        case EffectKind::AttackBonus:
        case EffectKind::DefenseBonus:
        case EffectKind::Ward:
        case EffectKind::StealOnKill:
        case EffectKind::ForcedSingleDie:
        case EffectKind::ExtendedRange:
        case EffectKind::VisionDamage:
        case EffectKind::VisionHeal:
        case EffectKind::VisionDamageIfTough:
            log::Warn("{} is not an instant effect", card.name);
            return CardOutcome{false, std::format("{} has no instant effect", card.name), 0};
        }
        return std::unexpected(error::Viol(RVC::Internal_Unreachable));
    }

    auto CardResolver::GiveVision(PlayerId const giver, uint16_t const card_id, PlayerId const receiver) -> CardResult
    {
        Player* g = session_.PlayerAt(giver);
        Player* r = session_.PlayerAt(receiver);
        if (g == nullptr || r == nullptr) return std::unexpected(Missing("unknown vision giver or receiver"));

        auto const it = std::ranges::find_if(g->Hand(), [card_id](CardSP const& c) { return c->id == card_id; });
        if (it == std::end(g->Hand()) || (*it)->type != CardType::Vision)
            return std::unexpected(error::Viol(RVC::Vision_CardNotInHand).with_actor(giver));

        CardSP card = std::move(*it);
        g->Hand().erase(it);

        CardEffect const& eff = card->effect;
        CardOutcome out{};
        bool const lies = Deceives(*r);
        auto denied = [&]
        {
            log::Debug("P{} answers a vision falsely", static_cast<int>(receiver));
            return CardOutcome{false, std::format("{}: P{} denies it", card->name, static_cast<int>(receiver)), 0};
        };
        switch (eff.kind)
        {
        case EffectKind::VisionDamage:
            if (RestrictionMatches(eff, r->Alignment()) && lies)
            {
                out = denied();
            }
            else if (RestrictionMatches(eff, r->Alignment()))
            {
                CombatResult<int> const dealt = combat_.ApplyDamage(giver, receiver, eff.value, DamageSource::Card);
                if (!dealt) return std::unexpected(dealt.error());
                out = CardOutcome{true, std::format("{}: P{} takes {}", card->name, static_cast<int>(receiver), *dealt), *dealt};
            }
            break;
        case EffectKind::VisionHeal:
            if (RestrictionMatches(eff, r->Alignment()) || lies)
            {
                int const healed = r->Heal(eff.value);
                out = CardOutcome{true, std::format("{}: P{} heals {}", card->name, static_cast<int>(receiver), healed), healed};
            }
            break;
        case EffectKind::VisionDamageIfTough:
            if (r->HpMax() >= 12 && lies)
            {
                out = denied();
            }
            else if (r->HpMax() >= 12)
            {
                CombatResult<int> const dealt = combat_.ApplyDamage(giver, receiver, eff.value, DamageSource::Card);
                if (!dealt) return std::unexpected(dealt.error());
                out = CardOutcome{true, std::format("{}: P{} takes {}", card->name, static_cast<int>(receiver), *dealt), *dealt};
            }
            break;
        default:
            log::Warn("{} handed over as a vision", card->name);
            break;
        }

        if (!out.applied && out.description.empty())
            out.description = std::format("{}: nothing happens to P{}", card->name, static_cast<int>(receiver));
        session_.DiscardCard(std::move(card));
        return out;
    }

    auto CardResolver::UseZone(PlayerId const user, PlayerId const target, ZoneChoice const choice) -> CardResult
    {
        Player* u = session_.PlayerAt(user);
        Player* t = session_.PlayerAt(target);
        if (u == nullptr || t == nullptr) return std::unexpected(Missing("unknown zone user or target"));
        if (!u->Position() || !board::HasZonePower(*u->Position()))
            return std::unexpected(error::Viol(RVC::Zone_NoPower).with_actor(user));

        if (*u->Position() == ZoneId::WeirdWoods)
        {
            if (choice == ZoneChoice::Heal)
            {
                int const healed = t->Heal(1);
                return CardOutcome{true, std::format("Weird Woods heals P{} by {}", static_cast<int>(target), healed), healed};
            }
            CombatResult<int> const dealt = combat_.ApplyDamage(user, target, 2, DamageSource::Zone);
            if (!dealt) return std::unexpected(dealt.error());
            return CardOutcome{true, std::format("Weird Woods deals {} to P{}", *dealt, static_cast<int>(target)), *dealt};
        }

        // Erstwhile Altar
        if (t->Equipment().empty() || target == user)
            return std::unexpected(error::Viol(RVC::Zone_IllegalTarget).with_actor(user).with_target(target));

        CardSP card = std::move(t->Equipment().front());
        t->Equipment().erase(std::begin(t->Equipment()));
        uint16_t const id = card->id;
        std::string desc = std::format("Erstwhile Altar takes {} from P{}", card->name, static_cast<int>(target));
        u->Equipment().push_back(std::move(card));
        bus_.Publish(EquipmentChanged{target, id, false});
        bus_.Publish(EquipmentChanged{user, id, true});
        return CardOutcome{true, std::move(desc), id};
    }
}
