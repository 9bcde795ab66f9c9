#pragma once

#include <QtTest/QtTest>

class SlotReconcilerTest : public QObject {
    Q_OBJECT

private slots:
    void test_first_publish_creates_slots();
    void test_same_content_edits_in_place();
    void test_growth_appends_slots();
    void test_shrink_deletes_trailing_slots();
    void test_edit_failure_sends_replacement();
    void test_throwing_edit_counts_as_failure();
    void test_missing_slot_sends_replacement();
    void test_send_failure_omits_slot();
    void test_delete_failure_is_ignored();
};
