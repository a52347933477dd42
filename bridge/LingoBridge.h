#pragma once

#ifdef __cplusplus
extern "C" {
#endif

/* Every call takes a JSON request and returns a malloc'd JSON envelope,
 * {"status":"ok",...} or {"status":"error","message":...}. Release it with
 * free_string. */
char *assess_proficiency(const char *request_json);
/* {"modules": [...] | {"reading": {...}, ...}} combined into one assessment. */
char *decide_upgrade(const char *request_json);
char *learner_statistics(const char *request_json);
char *review_word(const char *request_json);
char *review_queue(const char *request_json);
char *score_pronunciation(const char *request_json);
char *score_writing(const char *request_json);
/* Both keep the current review intervals. */
char *load_level_requirements(const char *path);
char *reset_level_requirements(void);
/* {"short_hours": [...], "medium_hours": [...], "long_hours": [...]};
 * missing bands fall back to the defaults. Keeps the level requirements. */
char *set_review_intervals(const char *request_json);
char *capabilities(void);
void free_string(char *ptr);

#ifdef __cplusplus
}
#endif
