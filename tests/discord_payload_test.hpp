#pragma once

#include <QtTest/QtTest>

class DiscordPayloadTest : public QObject {
    Q_OBJECT

private slots:
    void test_single_embed();
    void test_long_fields_truncated_on_character_boundary();
    void test_invalid_utf8_replaced();
};
