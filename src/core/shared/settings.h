#pragma once

#include <QString>
#include <cstdint>

namespace hr {

struct Settings {
    // Storage
    QString dbPath;
    QString indexDir;
    QString collectionName = QStringLiteral("technical_knowledge");

    // Chunking
    int chunkMaxSize = 1000;
    int chunkOverlap = 200;

    // Embedding
    uint32_t embeddingTimeoutMs = 30000;
    uint32_t localEmbeddingTimeoutMs = 60000;
    QString activeProviderId;
    int fallbackDimension = 768;
    QString openaiApiKey;              // Falls back to $OPENAI_API_KEY
    bool openaiEnabled = true;
    QString openaiBaseUrl = QStringLiteral("https://api.openai.com");
    QString ollamaBaseUrl = QStringLiteral("http://127.0.0.1:11434");
    bool ollamaEnabled = true;

    // Vector index sync
    int syncBatchSize = 50;
    uint32_t syncPauseMs = 100;
    int reembedCharLimit = 8000;

    // Retrieval
    double defaultAlpha = 0.6;
    int qualityMaxAgeYears = 10;
    double minQualityScore = 0.6;
};

} // namespace hr
