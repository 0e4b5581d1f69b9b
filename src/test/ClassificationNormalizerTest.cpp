#include <iostream>
#include <cassert>
#include <string>
#include <nlohmann/json.hpp>
#include "application/ClassificationNormalizer.hpp"
#include "domain/Lexicon.hpp"

using namespace ideasorter;
using domain::ClassificationProposal;
using domain::MutationAction;
using json = nlohmann::json;

static ClassificationProposal Proposal(const json& j) {
    return ClassificationProposal::FromJson(j);
}

static void testRejection() {
    std::cout << "[Test] makes_sense=false short-circuits..." << std::endl;
    application::ClassificationNormalizer normalizer(domain::Lexicon::ForLocale("es"));
    domain::KnowledgeTree tree;

    auto m = normalizer.normalize(Proposal({{"makes_sense", false}, {"reason", "no tiene sentido"},
                                            {"group", "compras"}, {"is_new_group", true}}),
                                  tree, "asdf qwer");
    assert(!m.makesSense);
    assert(m.reason == std::optional<std::string>("no tiene sentido"));
    assert(!m.group.has_value());
    assert(!m.isNewGroup);

    auto fallback = normalizer.normalize(Proposal({{"makes_sense", false}}), tree, "asdf");
    assert(fallback.reason == domain::Lexicon::ForLocale("es").defaultRejectionReason);
    std::cout << "[PASS] Rejection" << std::endl;
}

static void testDeleteIntentOverride() {
    std::cout << "[Test] Delete keywords turn an add into a delete..." << std::endl;
    application::ClassificationNormalizer normalizer(domain::Lexicon::ForLocale("es"));
    domain::KnowledgeTree tree;
    tree.addGroup("compras").ideas = {"leche", "pan"};

    auto m = normalizer.normalize(Proposal({{"action", "add"}, {"group", "compras"}, {"idea", "leche"},
                                            {"is_new_group", true}}),
                                  tree, "borra la leche de la lista de compras");
    assert(m.action == MutationAction::Delete);
    assert(m.group == std::optional<std::string>("compras"));
    assert(m.idea == std::optional<std::string>("leche"));
    assert(!m.isNewGroup && !m.isNewSubgroup && !m.inheritParentIdeas && !m.rename);

    // A reminder about deleting something stays a reminder.
    auto remind = normalizer.normalize(Proposal({{"action", "remind"}, {"idea", "borrar fotos"},
                                                 {"remind_at", "2026-03-01T09:00:00"}}),
                                       tree, "recuérdame borrar fotos");
    assert(remind.action == MutationAction::Remind);
    assert(remind.remindAt.has_value());
    assert(remind.remindAt->toIsoString() == "2026-03-01T09:00:00");

    auto invalidTime = normalizer.normalize(Proposal({{"action", "remind"}, {"idea", "borrar fotos"},
                                                      {"remind_at", "pronto"}}),
                                            tree, "recuérdame borrar fotos");
    assert(!invalidTime.remindAt.has_value());
    std::cout << "[PASS] Delete override" << std::endl;
}

static void testReuseMentionedGroup() {
    std::cout << "[Test] A group named in the note is reused..." << std::endl;
    application::ClassificationNormalizer normalizer(domain::Lexicon::ForLocale("es"));
    domain::KnowledgeTree tree;
    tree.addGroup("Proyecto Web");

    auto m = normalizer.normalize(Proposal({{"group", "Web nueva"}, {"is_new_group", true}, {"idea", "fondo azul"}}),
                                  tree, "cambiar el fondo del proyecto web a azul");
    assert(m.group == std::optional<std::string>("Proyecto Web"));
    assert(!m.isNewGroup);
    assert(m.idea == std::optional<std::string>("fondo azul"));
    std::cout << "[PASS] Mentioned group" << std::endl;
}

static void testMandatoryCategoryOverride() {
    std::cout << "[Test] Category keywords force a mandatory category..." << std::endl;
    application::ClassificationNormalizer normalizer(domain::Lexicon::ForLocale("es"));
    const json proposal = {{"group", "Panadería"}, {"is_new_group", true}, {"idea", "comprar pan"}};

    domain::KnowledgeTree empty;
    auto created = normalizer.normalize(Proposal(proposal), empty, "tengo que comprar pan");
    assert(created.group == std::optional<std::string>("compras"));
    assert(created.isNewGroup);

    domain::KnowledgeTree withGroup;
    withGroup.addGroup("Compras");
    auto reused = normalizer.normalize(Proposal(proposal), withGroup, "tengo que comprar pan");
    assert(reused.group == std::optional<std::string>("Compras"));
    assert(!reused.isNewGroup);

    // Longest keyword wins: "cena con" (social) beats "cena" (routine).
    assert(normalizer.guessCategory("cena con Ana el viernes") == std::optional<std::string>("vida social"));
    assert(normalizer.guessCategory("preparar la cena") == std::optional<std::string>("rutina diaria"));
    assert(!normalizer.guessCategory("hola").has_value());
    std::cout << "[PASS] Mandatory category" << std::endl;
}

static void testRoutineSubgroup() {
    std::cout << "[Test] Physical activities share one routine subgroup..." << std::endl;
    application::ClassificationNormalizer normalizer(domain::Lexicon::ForLocale("es"));
    domain::KnowledgeTree tree;

    auto m = normalizer.normalize(Proposal({{"group", "Natación"}, {"is_new_group", true},
                                            {"idea", "ir a nadar los martes"}}),
                                  tree, "quiero ir a nadar los martes");
    assert(m.group == std::optional<std::string>("rutina diaria"));
    assert(m.subgroup == std::optional<std::string>("deporte"));
    assert(m.isNewSubgroup);

    application::ClassificationNormalizer en(domain::Lexicon::ForLocale("en"));
    assert(en.routineSubgroup("go jogging before work") == std::optional<std::string>("sport"));
    std::cout << "[PASS] Routine subgroup" << std::endl;
}

static void testRenameIntegrity() {
    std::cout << "[Test] Rename survives only with is_new_group..." << std::endl;
    application::ClassificationNormalizer normalizer(domain::Lexicon::ForLocale("es"));
    domain::KnowledgeTree tree;
    tree.addGroup("Huerto");

    json proposal = {{"group", "Huerto casa"}, {"is_new_group", true}, {"idea", "plantar tomates"},
                     {"rename", {{"old_name", "Huerto"}, {"new_name", "Huerto escuela"}}}};
    auto kept = normalizer.normalize(Proposal(proposal), tree, "plantar tomates en casa");
    assert(kept.isNewGroup);
    assert(kept.rename.has_value());
    assert(kept.rename->newName == "Huerto escuela");

    proposal["is_new_group"] = false;
    auto dropped = normalizer.normalize(Proposal(proposal), tree, "plantar tomates en casa");
    assert(!dropped.isNewGroup);
    assert(!dropped.rename.has_value());
    std::cout << "[PASS] Rename integrity" << std::endl;
}

static void testBatchFlags() {
    std::cout << "[Test] Only the first batch element keeps creation flags..." << std::endl;
    application::ClassificationNormalizer normalizer(domain::Lexicon::ForLocale("es"));
    domain::KnowledgeTree tree;

    std::vector<ClassificationProposal> proposals = {
        Proposal({{"group", "Jardín"}, {"is_new_group", true}, {"idea", "regar plantas"}}),
        Proposal({{"group", "Jardín"}, {"is_new_group", true}, {"subgroup", "Riego"},
                  {"is_new_subgroup", true}, {"inherit_parent_ideas", true}, {"idea", "programar goteo"}})
    };
    auto batch = normalizer.normalizeBatch(proposals, tree, "regar las plantas del jardín y programar el goteo");
    assert(batch.size() == 2);
    assert(batch[0].isNewGroup);
    assert(!batch[1].isNewGroup && !batch[1].isNewSubgroup && !batch[1].inheritParentIdeas);
    assert(batch[1].subgroup == std::optional<std::string>("Riego"));

    auto empty = normalizer.normalizeBatch({}, tree, "nota");
    assert(empty.size() == 1);
    assert(!empty[0].makesSense);
    std::cout << "[PASS] Batch flags" << std::endl;
}

static void testProposalsFromJson() {
    std::cout << "[Test] Proposal extraction from decoded values..." << std::endl;
    using application::ClassificationNormalizer;
    assert(ClassificationNormalizer::ProposalsFromJson(json{{"group", "a"}}).size() == 1);
    assert(ClassificationNormalizer::ProposalsFromJson(json::array({{{"group", "a"}}, 5, {{"group", "b"}}})).size() == 2);
    assert(ClassificationNormalizer::ProposalsFromJson(
               json{{"results", json::array({{{"group", "a"}}, {{"group", "b"}}})}}).size() == 2);
    assert(ClassificationNormalizer::ProposalsFromJson(json("text")).empty());
    std::cout << "[PASS] Proposal extraction" << std::endl;
}

int main() {
    std::cout << "=== ClassificationNormalizer Test ===" << std::endl;
    testRejection();
    testDeleteIntentOverride();
    testReuseMentionedGroup();
    testMandatoryCategoryOverride();
    testRoutineSubgroup();
    testRenameIntegrity();
    testBatchFlags();
    testProposalsFromJson();
    std::cout << "=== All ClassificationNormalizer tests passed ===" << std::endl;
    return 0;
}
