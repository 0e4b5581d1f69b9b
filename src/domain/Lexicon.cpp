/**
 * @file Lexicon.cpp
 * @brief Spanish and English keyword tables.
 */

#include "domain/Lexicon.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>

namespace ideasorter::domain {

namespace {

Lexicon BuildSpanish() {
    Lexicon lx;
    lx.locale = "es";

    lx.deleteKeywords = {
        "elimina", "eliminar", "borra", "borrar", "quita", "quitar",
        "ya no quiero", "descarta", "descartar",
        "bórralo", "bórrala", "elimínalo", "elimínala",
        "ya no necesito", "tacha", "tachar"
    };

    lx.mandatoryCategories = {
        "rutina diaria", "compras", "trabajo/clase", "finanzas",
        "viajes", "vida social", "citas"
    };

    lx.categoryKeywords = {
        {"rutina diaria", {"dormir", "despertar", "levantarme", "levantarse", "acostarme",
                           "acostarse", "desayunar", "desayuno", "almorzar", "almuerzo",
                           "comer a las", "merendar", "merienda", "cenar", "cena",
                           "ducharme", "ducharse", "meditar", "rutina", "hábito", "horario de",
                           "hacer deporte", "deporte", "nadar", "natación", "natacion",
                           "correr", "running", "yoga", "ciclismo", "bici", "bicicleta",
                           "entrenar", "entrenamiento", "pilates", "boxeo", "gimnasio", "gym"}},
        {"compras", {"comprar", "necesito comprar", "tengo que comprar"}},
        {"trabajo/clase", {"examen", "entrega", "trabajo de clase", "reunión de trabajo",
                           "presentación del trabajo"}},
        {"finanzas", {"pagar el recibo", "pagar la factura", "pagar impuesto",
                      "recibo de", "factura de", "mi sueldo", "mis ahorros"}},
        {"viajes", {"viaje a", "viajar a", "vuelo a", "reservar hotel",
                    "billete de avión", "de vacaciones"}},
        {"vida social", {"quedar con", "quedada con", "cena con", "comida con",
                         "fiesta de", "cumpleaños de"}},
        {"citas", {"cita con el", "cita médica", "cita con mi", "ir al dentista",
                   "ir al médico", "cita con el dentista", "cita con el médico"}}
    };

    lx.routineCategory = "rutina diaria";
    lx.routineActivities = {
        {"dormir", "dormir"}, {"acostarme", "dormir"}, {"acostarse", "dormir"},
        {"levantarme", "levantarse"}, {"levantarse", "levantarse"},
        {"despertar", "levantarse"}, {"despertarme", "levantarse"},
        {"desayunar", "desayuno"}, {"desayuno", "desayuno"},
        {"almorzar", "almuerzo"}, {"almuerzo", "almuerzo"},
        {"comer", "comer"},
        {"merendar", "merienda"}, {"merienda", "merienda"},
        {"cenar", "cena"}, {"cena", "cena"},
        {"ducharme", "ducha"}, {"ducharse", "ducha"}, {"ducha", "ducha"},
        {"meditar", "meditación"}, {"meditación", "meditación"},
        {"deporte", "deporte"}, {"hacer deporte", "deporte"},
        {"nadar", "deporte"}, {"natación", "deporte"}, {"natacion", "deporte"},
        {"correr", "deporte"}, {"running", "deporte"}, {"yoga", "deporte"},
        {"ciclismo", "deporte"}, {"bicicleta", "deporte"}, {"pilates", "deporte"},
        {"boxeo", "deporte"}, {"ejercicio", "deporte"}, {"entrenar", "deporte"},
        {"entrenamiento", "deporte"}, {"gimnasio", "deporte"}, {"gym", "deporte"},
        {"estudiar", "estudio"}
    };

    lx.fillerPrefixes = {
        "me gustaría que", "me gustaria que", "me gustaría", "me gustaria",
        "quisiera", "quiero que", "quiero", "tengo que", "tengo ganas de",
        "voy a", "me apetece", "tendría que", "tendria que", "debería", "deberia",
        "me conviene", "necesito", "necesitaría", "necesitaria",
        "estoy pensando en", "pienso en", "pienso",
        "me interesaría", "me interesaria", "me mola",
        "me apetecería", "me apeteceria", "planifico", "planeo", "plan de"
    };

    lx.stopWords = {
        "el", "la", "los", "las", "un", "una", "unos", "unas",
        "de", "del", "al", "que", "en", "y", "a", "o", "con",
        "por", "para", "me", "te", "se", "le", "lo", "su",
        "si", "ya", "no", "como", "pero", "este", "esta",
        "ese", "esa", "aquel", "mi", "tu", "nos", "les"
    };

    lx.creationVerbs = {
        "añade", "anade", "agrega", "crea", "abre", "añadir", "anadir",
        "agregar", "crear", "abrir", "pon", "poner", "mete", "meter"
    };

    lx.creationKeywords = {
        "nuevo grupo", "nueva categoria", "nueva categoría", "el grupo", "un grupo",
        "el subgrupo", "un subgrupo", "nuevo subgrupo", "nueva sección",
        "nueva seccion", "subgrupo de"
    };

    lx.structuralWords = {"subgrupo", "grupo", "categoría", "categoria", "seccion", "sección"};

    lx.reminderTriggers = {
        "recuérdame", "recuerdame", "avísame", "avisame", "notifícame", "notificame",
        "ponme una alarma", "pon una alarma", "ponme un recordatorio",
        "pon un recordatorio", "no me dejes olvidar"
    };
    lx.dayAfterTomorrowPhrases = {"pasado mañana", "pasado manana"};
    lx.tomorrowWords = {"mañana", "manana"};
    lx.tomorrowExclusions = {
        "por la mañana", "de la mañana", "esta mañana",
        "por la manana", "de la manana", "esta manana"
    };
    lx.weekdayNames = {
        {"domingo", 0}, {"lunes", 1}, {"martes", 2}, {"miércoles", 3}, {"miercoles", 3},
        {"jueves", 4}, {"viernes", 5}, {"sábado", 6}, {"sabado", 6}
    };
    lx.timePrepositions = {"sobre las", "hacia las", "a las", "a la"};
    lx.pmSuffixes = {"de la tarde", "de la noche", "pm"};
    lx.amSuffixes = {"de la mañana", "de la manana", "de la madrugada", "am"};
    lx.connectorWords = {
        "que", "de", "para", "el", "la", "a", "este", "esta", "próximo", "proximo",
        "y", "por", "hoy"
    };
    lx.conjunctions = {" y ", " e "};
    lx.defaultRejectionReason = "La nota no expresa una idea clasificable.";
    return lx;
}

Lexicon BuildEnglish() {
    Lexicon lx;
    lx.locale = "en";

    lx.deleteKeywords = {
        "delete", "remove", "erase", "cross out", "cross off", "discard",
        "i no longer want", "i don't want", "no longer need", "get rid of", "scrap"
    };

    lx.mandatoryCategories = {
        "daily routine", "shopping", "work/school", "finances",
        "travel", "social life", "appointments"
    };

    lx.categoryKeywords = {
        {"daily routine", {"sleep", "wake up", "get up", "go to bed", "breakfast", "lunch",
                           "dinner", "shower", "meditate", "routine", "habit", "schedule for",
                           "exercise", "swim", "swimming", "run", "running", "jog", "jogging",
                           "yoga", "cycling", "bike", "workout", "pilates", "boxing", "gym",
                           "training"}},
        {"shopping", {"buy", "need to buy", "have to buy", "purchase", "groceries"}},
        {"work/school", {"exam", "deadline", "assignment", "homework", "work meeting",
                         "class presentation"}},
        {"finances", {"pay the bill", "pay the invoice", "pay taxes", "electricity bill",
                      "invoice for", "my salary", "my savings"}},
        {"travel", {"trip to", "travel to", "flight to", "book a hotel", "plane ticket",
                    "on vacation", "on holiday"}},
        {"social life", {"meet up with", "hang out with", "dinner with", "lunch with",
                         "party at", "birthday party"}},
        {"appointments", {"appointment with", "doctor's appointment", "dentist appointment",
                          "go to the dentist", "go to the doctor"}}
    };

    lx.routineCategory = "daily routine";
    lx.routineActivities = {
        {"sleep", "sleep"}, {"go to bed", "sleep"},
        {"wake up", "wake up"}, {"get up", "wake up"},
        {"breakfast", "breakfast"}, {"lunch", "lunch"}, {"dinner", "dinner"},
        {"shower", "shower"},
        {"meditate", "meditation"}, {"meditation", "meditation"},
        {"exercise", "sport"}, {"swim", "sport"}, {"swimming", "sport"},
        {"run", "sport"}, {"running", "sport"}, {"jog", "sport"}, {"jogging", "sport"},
        {"yoga", "sport"}, {"cycling", "sport"}, {"bike", "sport"}, {"pilates", "sport"},
        {"boxing", "sport"}, {"workout", "sport"}, {"training", "sport"}, {"gym", "sport"},
        {"study", "study"}
    };

    lx.fillerPrefixes = {
        "i would like to", "i'd like to", "i would like", "i'd like",
        "i want to", "i wanna", "i want", "i need to", "i need", "i have to",
        "i should", "i'm going to", "i am going to", "i'm thinking about",
        "i am thinking about", "i plan to", "we should", "let's", "remember to"
    };

    lx.stopWords = {
        "the", "a", "an", "of", "to", "in", "on", "at", "for", "with", "and", "or",
        "my", "your", "is", "it", "that", "this", "i", "me", "we", "be", "by",
        "from", "as", "some", "our"
    };

    lx.creationVerbs = {"add", "create", "open"};

    lx.creationKeywords = {
        "new group", "new category", "new subgroup", "new section",
        "the group", "a group", "the subgroup", "a subgroup", "subgroup of"
    };

    lx.structuralWords = {"subgroup", "group", "category", "section"};

    lx.reminderTriggers = {
        "remind me", "notify me", "alert me", "ping me",
        "set an alert", "set a reminder", "set an alarm"
    };
    lx.dayAfterTomorrowPhrases = {"the day after tomorrow", "day after tomorrow"};
    lx.tomorrowWords = {"tomorrow"};
    lx.weekdayNames = {
        {"sunday", 0}, {"monday", 1}, {"tuesday", 2}, {"wednesday", 3},
        {"thursday", 4}, {"friday", 5}, {"saturday", 6}
    };
    lx.timePrepositions = {"around", "at", "by"};
    lx.pmSuffixes = {"pm", "p.m.", "in the evening", "in the afternoon", "at night"};
    lx.amSuffixes = {"am", "a.m.", "in the morning"};
    lx.connectorWords = {"to", "that", "on", "at", "about", "for", "this", "next", "and", "by", "today"};
    lx.conjunctions = {" and "};
    lx.defaultRejectionReason = "The note does not express a classifiable idea.";
    return lx;
}

} // namespace

bool Lexicon::isMandatoryCategory(const std::string& name) const {
    return std::any_of(mandatoryCategories.begin(), mandatoryCategories.end(),
                       [&name](const std::string& category) { return text::SameName(category, name); });
}

bool Lexicon::isStopWord(const std::string& token) const {
    return std::find(stopWords.begin(), stopWords.end(), token) != stopWords.end();
}

const Lexicon& Lexicon::ForLocale(const std::string& locale) {
    static const Lexicon spanish = BuildSpanish();
    static const Lexicon english = BuildEnglish();

    std::string lang = text::ToLower(text::Trim(locale)).substr(0, 2);
    if (lang == "en") return english;
    return spanish;
}

} // namespace ideasorter::domain
