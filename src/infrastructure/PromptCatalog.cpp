#include "infrastructure/PromptCatalog.hpp"
#include "domain/TextUtils.hpp"

namespace ideasorter::infrastructure {

using json = nlohmann::json;

namespace {

bool IsEnglish(const std::string& locale) {
    return domain::text::ToLower(locale).rfind("en", 0) == 0;
}

json Proposal(const std::string& action, const json& group, const json& subgroup, const json& idea,
              bool isNewGroup, bool isNewSubgroup) {
    return {
        {"action", action},
        {"makes_sense", true},
        {"reason", nullptr},
        {"group", group},
        {"subgroup", subgroup},
        {"idea", idea},
        {"is_new_group", isNewGroup},
        {"is_new_subgroup", isNewSubgroup},
        {"inherit_parent_ideas", false},
        {"rename", nullptr}
    };
}

struct Example {
    std::string note;
    json existing;
    json result;
};

std::vector<Example> SpanishExamples() {
    json deporte = json::array({
        {{"name", "rutina diaria"}, {"ideas", json::array()},
         {"subgroups", json::array({{{"name", "deporte"}, {"ideas", {"nadar a las 8 martes"}}}})}}
    });
    json compras = json::array({
        {{"name", "compras"}, {"ideas", {"leche", "pan"}}, {"subgroups", json::array()}}
    });
    return {
        {"elimina la idea de nadar", deporte,
         Proposal("delete", "rutina diaria", "deporte", "nadar a las 8 martes", false, false)},
        {"comprar pan en el super", json::array(),
         Proposal("add", "compras", "super", "pan", true, true)},
        {"levantarme a las 7", json::array(),
         Proposal("add", "rutina diaria", "levantarse", "a las 7", true, true)},
        {"comprar leche y huevos", compras,
         json::array({Proposal("add", "compras", nullptr, "leche", false, false),
                      Proposal("add", "compras", nullptr, "huevos", false, false)})},
        {"me gustaría crear una página web", json::array(),
         Proposal("add", "página web", nullptr, nullptr, true, false)},
        {"asdfgh el el", json::array(),
         {{"makes_sense", false}, {"reason", "Texto sin significado"}}}
    };
}

std::vector<Example> EnglishExamples() {
    json sport = json::array({
        {{"name", "daily routine"}, {"ideas", json::array()},
         {"subgroups", json::array({{{"name", "sport"}, {"ideas", {"swim at 8 tuesdays"}}}})}}
    });
    json shopping = json::array({
        {{"name", "shopping"}, {"ideas", {"milk", "bread"}}, {"subgroups", json::array()}}
    });
    return {
        {"delete the swimming idea", sport,
         Proposal("delete", "daily routine", "sport", "swim at 8 tuesdays", false, false)},
        {"buy bread at the supermarket", json::array(),
         Proposal("add", "shopping", "supermarket", "bread", true, true)},
        {"wake up at 7", json::array(),
         Proposal("add", "daily routine", "wake up", "at 7", true, true)},
        {"buy milk and eggs", shopping,
         json::array({Proposal("add", "shopping", nullptr, "milk", false, false),
                      Proposal("add", "shopping", nullptr, "eggs", false, false)})},
        {"I'd like to build a website", json::array(),
         Proposal("add", "website", nullptr, nullptr, true, false)},
        {"asdfgh the the", json::array(),
         {{"makes_sense", false}, {"reason", "Meaningless text"}}}
    };
}

std::string QuotedList(const std::vector<std::string>& values) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i) out += ", ";
        out += "\"" + values[i] + "\"";
    }
    return out;
}

json ProposalProperties(bool english) {
    auto str = [](const std::string& description) {
        return json{{"type", "string"}, {"description", description}};
    };
    auto flag = [](const std::string& description) {
        return json{{"type", "boolean"}, {"description", description}};
    };
    return {
        {"group", str(english ? "Group name (max 3 words)" : "Nombre del grupo (máximo 3 palabras)")},
        {"subgroup", str(english ? "Place or context, if any" : "Lugar o contexto, si lo hay")},
        {"idea", str(english ? "Essential concept, 1-4 words" : "Concepto esencial, 1-4 palabras")},
        {"is_new_group", flag(english ? "True when the group does not exist yet" : "True si el grupo no existe aún")},
        {"is_new_subgroup", flag(english ? "True when the subgroup does not exist yet" : "True si el subgrupo no existe aún")},
        {"inherit_parent_ideas", flag(english ? "Copy the group's ideas into the new subgroup" : "Copiar las ideas del grupo al nuevo subgrupo")}
    };
}

json Tool(const std::string& name, const std::string& description, const json& properties,
          const std::vector<std::string>& required) {
    return {
        {"type", "function"},
        {"function", {
            {"name", name},
            {"description", description},
            {"parameters", {
                {"type", "object"},
                {"properties", properties},
                {"required", required}
            }}
        }}
    };
}

} // namespace

std::string PromptCatalog::GetClassificationSystemPrompt(const domain::Lexicon& lexicon) {
    const std::string categories = QuotedList(lexicon.mandatoryCategories);

    if (IsEnglish(lexicon.locale)) {
        return
            "You organize ideas into a two-level tree (group -> optional subgroup -> ideas). "
            "Distill every note to its minimal schematic form.\n\n"
            "STEP 0 - DELETE: if the user wants to remove something (\"delete\", \"remove\", \"I no longer want\"...), "
            "answer action=\"delete\" with the group, subgroup and idea to remove from the existing tree. "
            "idea=null removes a whole subgroup; idea=null and subgroup=null removes the whole group.\n"
            "STEP 1 - SENSE: random keystrokes, meaningless text or questions to the assistant get "
            "{\"makes_sense\": false, \"reason\": \"...\"}.\n"
            "STEP 2 - MANDATORY CATEGORIES always exist: " + categories + ". Use them whenever the note fits. "
            "Every physical activity goes to subgroup \"sport\" of \"daily routine\".\n"
            "STEP 3 - The idea is the essential noun or concept, 1 to 4 words, NEVER a copy of the note. "
            "Drop verbs already implied by the group (group=\"shopping\", idea=\"bread\", not \"buy bread\").\n"
            "STEP 4 - Use a subgroup only for a concrete place, shop, platform or context.\n"
            "STEP 5 - idea=null for personal initiatives (\"open a bakery\" -> group=\"bakery\") and for pure "
            "group/subgroup creation commands. Several distinct items -> a JSON ARRAY with one object per idea; "
            "only the first object may set is_new_group/is_new_subgroup.\n"
            "STEP 6 - Group names: the topic, at most 3 words. Reuse an existing group when the topic matches.\n"
            "STEP 7 - Only when a NEW group collides with an existing one, set "
            "\"rename\": {\"old_name\": \"...\", \"new_name\": \"...\"} to disambiguate the old group.\n"
            "STEP 8 - Answer ONLY with JSON:\n"
            "{\"action\":\"add\",\"makes_sense\":true,\"reason\":null,\"group\":\"...\",\"subgroup\":null,"
            "\"idea\":\"...\",\"is_new_group\":false,\"is_new_subgroup\":false,"
            "\"inherit_parent_ideas\":false,\"rename\":null}";
    }

    return
        "Eres un asistente que organiza ideas en un árbol de dos niveles (grupo -> subgrupo opcional -> ideas). "
        "Destila cada nota al mínimo esquemático posible.\n\n"
        "PASO 0 - ELIMINAR: si el usuario quiere quitar algo (\"elimina\", \"borra\", \"ya no quiero\"...), "
        "responde action=\"delete\" con el grupo, subgrupo e idea a borrar del árbol existente. "
        "idea=null borra el subgrupo entero; idea=null y subgroup=null borra el grupo entero.\n"
        "PASO 1 - SENTIDO: teclas al azar, texto sin significado o preguntas al asistente devuelven "
        "{\"makes_sense\": false, \"reason\": \"...\"}.\n"
        "PASO 2 - CATEGORÍAS OBLIGATORIAS, siempre existen: " + categories + ". Úsalas si la nota encaja. "
        "Toda actividad física va al subgrupo \"deporte\" de \"rutina diaria\".\n"
        "PASO 3 - La idea es el sustantivo o concepto esencial, de 1 a 4 palabras, NUNCA una copia de la nota. "
        "Quita el verbo que ya implica el grupo (grupo=\"compras\", idea=\"pan\", no \"comprar pan\").\n"
        "PASO 4 - Usa subgrupo solo para un lugar, tienda, plataforma o contexto concreto.\n"
        "PASO 5 - idea=null para iniciativas propias (\"abrir una panadería\" -> grupo=\"panadería\") y para "
        "comandos que solo crean un grupo o subgrupo. Varias cosas distintas -> un ARRAY JSON con un objeto por "
        "idea; solo el primero puede tener is_new_group/is_new_subgroup.\n"
        "PASO 6 - Nombre de grupo: el tema, máximo 3 palabras. Reutiliza un grupo existente si el tema coincide.\n"
        "PASO 7 - Solo cuando un grupo NUEVO colisiona con uno existente, usa "
        "\"rename\": {\"old_name\": \"...\", \"new_name\": \"...\"} para desambiguar el antiguo.\n"
        "PASO 8 - Responde SOLO con JSON:\n"
        "{\"action\":\"add\",\"makes_sense\":true,\"reason\":null,\"group\":\"...\",\"subgroup\":null,"
        "\"idea\":\"...\",\"is_new_group\":false,\"is_new_subgroup\":false,"
        "\"inherit_parent_ideas\":false,\"rename\":null}";
}

std::string PromptCatalog::GetClassificationPrompt(const std::string& noteText,
                                                   const domain::KnowledgeTree& tree,
                                                   const domain::Lexicon& lexicon) {
    const bool english = IsEnglish(lexicon.locale);
    const auto examples = english ? EnglishExamples() : SpanishExamples();

    std::string prompt;
    for (const auto& example : examples) {
        prompt += english ? "\nEXAMPLE:\nNote: \"" : "\nEJEMPLO:\nNota: \"";
        prompt += example.note + "\"\n";
        prompt += (english ? "Existing groups: " : "Grupos existentes: ") + example.existing.dump() + "\n";
        prompt += (english ? "Answer: " : "Respuesta: ") + example.result.dump() + "\n";
    }

    const std::string categories = QuotedList(lexicon.mandatoryCategories);
    const auto names = tree.groupNames();

    if (english) {
        prompt += "\nNOW CLASSIFY:\nNote: \"" + noteText + "\"\n";
        prompt += "State: " + tree.toJson().dump() + "\n";
        prompt += "MANDATORY CATEGORIES (always exist): " + categories + "\n";
        if (names.empty()) {
            prompt += "(No existing groups: use a mandatory category if it fits, otherwise create a new group)\n";
        } else {
            prompt += "Existing groups: " + QuotedList(names) + "\n";
            prompt += "Same topic as one of them or a mandatory category? Reuse it with is_new_group=false. "
                      "Otherwise is_new_group=true with a new descriptive name.\n";
        }
        prompt += "Answer (JSON only):";
        return prompt;
    }

    prompt += "\nAHORA CLASIFICA:\nNota: \"" + noteText + "\"\n";
    prompt += "Estado: " + tree.toJson().dump() + "\n";
    prompt += "CATEGORÍAS OBLIGATORIAS (siempre existen): " + categories + "\n";
    if (names.empty()) {
        prompt += "(No hay grupos existentes: usa una categoría obligatoria si aplica, si no crea un grupo nuevo)\n";
    } else {
        prompt += "Grupos existentes: " + QuotedList(names) + "\n";
        prompt += "¿La nota habla del mismo tema que alguno de ellos o de una categoría obligatoria? "
                  "Si sí, úsalo con is_new_group=false. Si no, is_new_group=true con un nombre nuevo.\n";
    }
    prompt += "Respuesta (solo JSON):";
    return prompt;
}

json PromptCatalog::GetClassificationTools(const domain::Lexicon& lexicon) {
    const bool english = IsEnglish(lexicon.locale);
    json addProps = ProposalProperties(english);
    addProps["rename"] = {
        {"type", "object"},
        {"description", english ? "Rename of a colliding existing group" : "Renombrado de un grupo existente que colisiona"},
        {"properties", {{"old_name", {{"type", "string"}}}, {"new_name", {{"type", "string"}}}}}
    };

    json deleteProps = {
        {"group", {{"type", "string"}}},
        {"subgroup", {{"type", "string"}}},
        {"idea", {{"type", "string"}}}
    };
    json remindProps = {
        {"idea", {{"type", "string"}, {"description", english ? "Reminder message" : "Mensaje del recordatorio"}}},
        {"remind_at", {{"type", "string"}, {"description", "YYYY-MM-DDTHH:MM:SS"}}}
    };
    json rejectProps = {
        {"reason", {{"type", "string"}}}
    };

    return json::array({
        Tool("add_idea", english ? "File one idea into the tree" : "Guarda una idea en el árbol", addProps, {"group"}),
        Tool("delete_idea", english ? "Remove an idea, subgroup or group" : "Elimina una idea, subgrupo o grupo", deleteProps, {"group"}),
        Tool("schedule_reminder", english ? "Schedule a reminder" : "Programa un recordatorio", remindProps, {"idea"}),
        Tool("reject_note", english ? "The note is not a classifiable idea" : "La nota no es una idea clasificable", rejectProps, {"reason"})
    });
}

std::string PromptCatalog::GetSummarySystemPrompt(const std::string& locale) {
    if (IsEnglish(locale)) {
        return
            "You are an organization and productivity assistant. Analyze a set of notes grouped by topic "
            "and produce a structured summary with actionable key points.\n\n"
            "RULES:\n"
            "- Always answer with valid JSON and nothing else.\n"
            "- Each group summary is a clear, motivating paragraph (2-4 sentences).\n"
            "- Key points are concrete and actionable (\"Do X\", \"Buy Y\").\n"
            "- A key point category is one of: \"action\", \"goal\", \"reminder\", \"resource\".\n"
            "- \"suggested_title\" is a short descriptive title (max 4 words).\n"
            "- \"global_summary\" sums up every group in 2-3 sentences.\n\n"
            "FORMAT:\n"
            "{\"groups\": [{\"group_name\": \"...\", \"suggested_title\": \"...\", \"summary\": \"...\", "
            "\"key_points\": [{\"text\": \"...\", \"category\": \"action\"}]}], \"global_summary\": \"...\"}";
    }
    return
        "Eres un asistente experto en organización y productividad. Analiza un conjunto de notas organizadas "
        "por grupo y genera un resumen estructurado con puntos clave accionables.\n\n"
        "REGLAS:\n"
        "- Responde SIEMPRE con un JSON válido, sin texto adicional.\n"
        "- El resumen de cada grupo es un párrafo claro y motivador (2-4 frases).\n"
        "- Los puntos clave son concretos, accionables y en infinitivo (\"Hacer X\", \"Comprar Y\").\n"
        "- La categoría de cada punto es: \"acción\", \"meta\", \"recordatorio\" o \"recurso\".\n"
        "- \"suggested_title\" es un título corto y descriptivo (máximo 4 palabras).\n"
        "- \"global_summary\" resume todos los grupos en 2-3 frases.\n\n"
        "FORMATO:\n"
        "{\"groups\": [{\"group_name\": \"...\", \"suggested_title\": \"...\", \"summary\": \"...\", "
        "\"key_points\": [{\"text\": \"...\", \"category\": \"acción\"}]}], \"global_summary\": \"...\"}";
}

std::string PromptCatalog::GetSummaryPrompt(const json& groups, const std::string& locale) {
    if (IsEnglish(locale)) {
        return "Analyze the following groups and their notes and produce the structured summary:\n\n"
               "GROUPS:\n" + groups.dump(2) + "\n\nAnswer (JSON only):";
    }
    return "Analiza los siguientes grupos y sus notas, y genera el resumen estructurado:\n\n"
           "GRUPOS:\n" + groups.dump(2) + "\n\nRespuesta (solo JSON):";
}

std::string PromptCatalog::GetSingleGroupSummaryPrompt(const json& group, const std::string& locale) {
    const std::string name = group.value("name", "");
    if (IsEnglish(locale)) {
        return "Analyze the following group and its notes:\n\nGROUP:\n" + group.dump(2) +
               "\n\nProduce a summary and key points with exactly this JSON:\n"
               "{\"group_name\": \"" + name + "\", \"suggested_title\": \"title (max 4 words)\", "
               "\"summary\": \"2-4 sentences\", \"key_points\": [{\"text\": \"actionable point\", "
               "\"category\": \"action|goal|reminder|resource\"}]}\n\nJSON only:";
    }
    return "Analiza el siguiente grupo y sus notas:\n\nGRUPO:\n" + group.dump(2) +
           "\n\nGenera un resumen y puntos clave con este JSON exacto:\n"
           "{\"group_name\": \"" + name + "\", \"suggested_title\": \"título (máximo 4 palabras)\", "
           "\"summary\": \"resumen en 2-4 frases\", \"key_points\": [{\"text\": \"punto clave accionable\", "
           "\"category\": \"acción|meta|recordatorio|recurso\"}]}\n\nSolo JSON:";
}

std::string PromptCatalog::GetGlobalSummarySystemPrompt(const std::string& locale) {
    return IsEnglish(locale) ? "You are a concise and motivating assistant."
                             : "Eres un asistente conciso y motivador.";
}

std::string PromptCatalog::GetGlobalSummaryPrompt(const json& summaries, const std::string& locale) {
    if (IsEnglish(locale)) {
        return "Given the following group summaries, write one overall paragraph (2-3 sentences) describing "
               "the big picture of all the user's ideas.\n\n" + summaries.dump(2) +
               "\n\nAnswer with the paragraph text only, no JSON or formatting:";
    }
    return "Dado el siguiente resumen de grupos, escribe un párrafo global (2-3 frases) que describa el "
           "panorama general de todas las ideas del usuario.\n\n" + summaries.dump(2) +
           "\n\nResponde solo con el texto del párrafo, sin JSON ni formato adicional:";
}

} // namespace ideasorter::infrastructure
