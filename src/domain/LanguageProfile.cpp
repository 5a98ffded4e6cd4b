/**
 * @file LanguageProfile.cpp
 * @brief Language table and script detection.
 */

#include "domain/LanguageProfile.hpp"

#include "domain/TextUtils.hpp"

#include <map>

namespace thoughtflow::domain {

namespace {

const std::map<std::string, std::string>& AliasTable() {
    static const std::map<std::string, std::string> table = {
        {"en", "English"}, {"english", "English"},
        {"ar", "Arabic"}, {"arabic", "Arabic"},
        {"fr", "French"}, {"french", "French"},
        {"es", "Spanish"}, {"spanish", "Spanish"},
        {"de", "German"}, {"german", "German"},
        {"zh", "Chinese"}, {"chinese", "Chinese"},
        {"ja", "Japanese"}, {"japanese", "Japanese"},
        {"ko", "Korean"}, {"korean", "Korean"},
        {"ru", "Russian"}, {"russian", "Russian"},
        {"pt", "Portuguese"}, {"portuguese", "Portuguese"},
        {"el", "Greek"}, {"greek", "Greek"},
        {"he", "Hebrew"}, {"hebrew", "Hebrew"},
        {"hi", "Hindi"}, {"hindi", "Hindi"},
        {"fa", "Persian"}, {"persian", "Persian"}, {"farsi", "Persian"},
        {"ur", "Urdu"}, {"urdu", "Urdu"}
    };
    return table;
}

} // namespace

LanguageProfile LanguageProfile::FromName(const std::string& language) {
    LanguageProfile profile;
    const std::string key = text::ToLowerAscii(text::Trim(language));
    const auto& aliases = AliasTable();
    auto it = aliases.find(key);
    if (it == aliases.end()) {
        return profile;
    }
    profile.m_name = it->second;
    const std::string& name = profile.m_name;

    if (name == "Arabic" || name == "Persian" || name == "Urdu") {
        profile.m_scriptRanges = {{0x0600, 0x06FF}, {0x0750, 0x077F}, {0xFB50, 0xFDFF}, {0xFE70, 0xFEFF}};
        profile.m_rtl = true;
    } else if (name == "Hebrew") {
        profile.m_scriptRanges = {{0x0590, 0x05FF}, {0xFB1D, 0xFB4F}};
        profile.m_rtl = true;
    } else if (name == "Russian") {
        profile.m_scriptRanges = {{0x0400, 0x04FF}, {0x0500, 0x052F}};
    } else if (name == "Greek") {
        profile.m_scriptRanges = {{0x0370, 0x03FF}, {0x1F00, 0x1FFF}};
    } else if (name == "Hindi") {
        profile.m_scriptRanges = {{0x0900, 0x097F}};
    } else if (name == "Chinese") {
        profile.m_scriptRanges = {{0x4E00, 0x9FFF}, {0x3400, 0x4DBF}, {0xF900, 0xFAFF}};
    } else if (name == "Japanese") {
        profile.m_scriptRanges = {{0x3040, 0x309F}, {0x30A0, 0x30FF}, {0x4E00, 0x9FFF}};
    } else if (name == "Korean") {
        profile.m_scriptRanges = {{0xAC00, 0xD7AF}, {0x1100, 0x11FF}, {0x3130, 0x318F}};
    }

    if (name == "Arabic") {
        profile.m_noOverview = "لا تتوفر نظرة عامة.";
        profile.m_descriptionPrefix = "يجمع هذا الموضوع مقاطع حول";
    } else if (name == "French") {
        profile.m_noOverview = "Aucun aperçu disponible.";
        profile.m_descriptionPrefix = "Ce thème regroupe des passages sur";
    } else if (name == "Spanish") {
        profile.m_noOverview = "No hay resumen disponible.";
        profile.m_descriptionPrefix = "Este tema agrupa pasajes sobre";
    } else if (name == "German") {
        profile.m_noOverview = "Keine Übersicht verfügbar.";
        profile.m_descriptionPrefix = "Dieses Thema fasst Abschnitte zusammen über";
    } else if (name == "Portuguese") {
        profile.m_noOverview = "Nenhuma visão geral disponível.";
        profile.m_descriptionPrefix = "Este tema reúne trechos sobre";
    } else if (name == "Russian") {
        profile.m_noOverview = "Обзор недоступен.";
        profile.m_descriptionPrefix = "Эта тема объединяет фрагменты о";
    } else if (name == "Chinese") {
        profile.m_noOverview = "暂无概述。";
        profile.m_descriptionPrefix = "该主题汇集了关于以下内容的段落:";
    } else if (name == "Japanese") {
        profile.m_noOverview = "概要はありません。";
        profile.m_descriptionPrefix = "このトピックは次に関する文章をまとめています:";
    } else if (name == "Korean") {
        profile.m_noOverview = "개요가 없습니다.";
        profile.m_descriptionPrefix = "이 주제는 다음에 관한 구절을 모읍니다:";
    } else if (name == "Greek") {
        profile.m_noOverview = "Δεν υπάρχει διαθέσιμη επισκόπηση.";
        profile.m_descriptionPrefix = "Αυτό το θέμα συγκεντρώνει αποσπάσματα για";
    } else if (name == "Hebrew") {
        profile.m_noOverview = "אין סקירה זמינה.";
        profile.m_descriptionPrefix = "נושא זה מקבץ קטעים על";
    } else if (name == "Hindi") {
        profile.m_noOverview = "कोई अवलोकन उपलब्ध नहीं है।";
        profile.m_descriptionPrefix = "यह विषय इनसे संबंधित अंशों को समूहित करता है:";
    } else if (name == "Persian") {
        profile.m_noOverview = "مروری در دسترس نیست.";
        profile.m_descriptionPrefix = "این موضوع بخش‌هایی درباره این مورد را گرد می‌آورد:";
    } else if (name == "Urdu") {
        profile.m_noOverview = "کوئی جائزہ دستیاب نہیں۔";
        profile.m_descriptionPrefix = "یہ موضوع ان حصوں کو یکجا کرتا ہے جو اس بارے میں ہیں:";
    }
    return profile;
}

bool LanguageProfile::containsScript(const std::string& text) const {
    if (m_scriptRanges.empty()) return true;
    for (char32_t cp : text::DecodeUtf8(text)) {
        for (const auto& [lo, hi] : m_scriptRanges) {
            if (cp >= lo && cp <= hi) return true;
        }
    }
    return false;
}

std::string LanguageProfile::fallbackDescription(const std::string& label) const {
    return m_descriptionPrefix + " " + label + ".";
}

} // namespace thoughtflow::domain
