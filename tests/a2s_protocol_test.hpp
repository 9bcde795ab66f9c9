#pragma once

#include <QtTest/QtTest>

class A2SProtocolTest : public QObject {
    Q_OBJECT

private slots:
    void test_info_request();
    void test_info_request_with_challenge();
    void test_player_request();
    void test_challenge_reply();
    void test_info_reply();
    void test_player_reply();
    void test_split_reply_rejected();
    void test_truncated_reply_rejected();
};
