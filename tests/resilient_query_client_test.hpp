#pragma once

#include <QtTest/QtTest>

class ResilientQueryClientTest : public QObject {
    Q_OBJECT

private slots:
    void test_live_result();
    void test_failure_without_cache_is_empty();
    void test_failure_falls_back_to_cached_value();
    void test_non_standard_exception_is_a_failure();
    void test_retry_recovers();
    void test_retry_budget_is_bounded();
    void test_negative_retries_mean_single_attempt();
    void test_client_never_writes_cache();
};
