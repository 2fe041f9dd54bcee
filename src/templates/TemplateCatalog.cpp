#include "mindgraph/templates/TemplateCatalog.h"

#include <algorithm>

namespace mindgraph {

TemplateCatalog TemplateCatalog::builtin() {
    TemplateCatalog catalog;

    catalog.registerTemplate("school-organized", {
        "Academic Hub", "Academic Success", {
            {"Courses", {"Current Semester", "Prerequisites", "Electives", "Study Materials"}},
            {"Assignments", {"Weekly Tasks", "Term Papers", "Group Projects", "Lab Reports"}},
            {"Schedule", {"Class Timetable", "Study Blocks", "Office Hours", "Deadlines"}},
            {"Goals", {"Grade Targets", "Skill Development", "Extracurriculars", "Career Prep"}},
            {"Resources", {"Textbooks", "Online Libraries", "Study Groups", "Tutoring"}},
        }});

    catalog.registerTemplate("business-structured", {
        "Business Framework", "Business Strategy", {
            {"Vision & Mission", {"Core Values", "Strategic Goals", "Brand Identity", "Market Position"}},
            {"Operations", {"Process Mapping", "Quality Control", "Supply Chain", "Risk Management"}},
            {"Finance", {"Budget Planning", "Revenue Streams", "Cost Analysis", "Investment Strategy"}},
            {"Team", {"Organizational Chart", "Skill Gaps", "Training Programs", "Culture Building"}},
            {"Growth", {"Market Expansion", "Product Development", "Partnerships", "Competitive Analysis"}},
        }});

    catalog.registerTemplate("project-management", {
        "Project Hub", "Project Management", {
            {"Planning", {"Scope Definition", "Requirements", "Timeline", "Milestones"}},
            {"Team", {"Roles & Responsibilities", "Communication Plan", "Stakeholder Map", "Resource Allocation"}},
            {"Execution", {"Task Breakdown", "Dependencies", "Progress Tracking", "Quality Assurance"}},
            {"Monitoring", {"Status Reports", "Risk Register", "Budget Tracking", "Performance Metrics"}},
            {"Review", {"Lessons Learned", "Retrospectives", "Success Metrics", "Next Steps"}},
        }});

    catalog.registerTemplate("knowledge-base", {
        "Knowledge Hub", "Knowledge Management", {
            {"Learning", {"Topics of Interest", "Books to Read", "Courses", "Skill Development"}},
            {"Ideas", {"Brainstorming", "Innovation Pipeline", "Problem Solving", "Creative Projects"}},
            {"Connections", {"Related Concepts", "Cross-references", "Applications", "Implications"}},
            {"Notes", {"Meeting Notes", "Research Findings", "Personal Insights", "Quick References"}},
            {"Insights", {"Key Takeaways", "Best Practices", "Lessons Learned", "Action Items"}},
        }});

    catalog.registerTemplate("personal-productivity", {
        "Life Organization", "Personal Productivity", {
            {"Goals", {"Short-term Goals", "Long-term Vision", "Quarterly Objectives", "Personal Mission"}},
            {"Time Management", {"Daily Routines", "Weekly Planning", "Time Blocking", "Priority Matrix"}},
            {"Life Areas", {"Health & Fitness", "Relationships", "Career", "Personal Growth"}},
            {"Work-Life", {"Professional Development", "Work Projects", "Skill Building", "Network Building"}},
            {"Hobbies", {"Creative Projects", "Learning Activities", "Travel Plans", "Personal Interests"}},
        }});

    catalog.registerTemplate("decision-tree", {
        "Decision Framework", "Decision Making", {
            {"Analysis", {"Problem Statement", "Gather Information", "Identify Options", "Evaluate Criteria"}},
            {"Evaluation", {"Pros & Cons", "Risk Assessment", "Impact Analysis", "Stakeholder Views"}},
            {"Decision", {"Recommended Choice", "Rationale", "Implementation Plan", "Contingency Plans"}},
            {"Monitoring", {"Success Metrics", "Progress Tracking", "Review Points", "Adjustment Triggers"}},
        }});

    catalog.registerTemplate("timeline", {
        "Timeline Planning", "Timeline Management", {
            {"Goals", {"Vision Statement", "Long-term Objectives", "Success Criteria", "Milestone Definition"}},
            {"Phases", {"Planning Phase", "Execution Phase", "Monitoring Phase", "Completion Phase"}},
            {"Milestones", {"Key Deliverables", "Review Points", "Decision Gates", "Celebration Points"}},
            {"Progress", {"Weekly Check-ins", "Monthly Reviews", "Quarterly Assessments", "Annual Planning"}},
        }});

    catalog.registerTemplate("swot-analysis", {
        "SWOT Analysis", "Strategic Analysis", {
            {"Strengths", {"Core Competencies", "Unique Advantages", "Internal Resources", "Market Position"}},
            {"Weaknesses", {"Areas for Improvement", "Resource Gaps", "Process Issues", "Competitive Disadvantages"}},
            {"Opportunities", {"Market Trends", "Partnership Potential", "Technology Advances", "Expansion Possibilities"}},
            {"Threats", {"Competitive Risks", "Market Changes", "Regulatory Issues", "Economic Factors"}},
        }});

    catalog.registerTemplate("mind-map-starter", {
        "Mind Map Starter", "Central Topic", {
            {"Key Concepts", {"Main Ideas", "Core Principles", "Important Facts", "Key Questions"}},
            {"Connections", {"Related Topics", "Associated Ideas", "Cross-references", "Applications"}},
            {"Details", {"Supporting Information", "Examples", "Evidence", "Explanations"}},
            {"Reflections", {"Personal Thoughts", "Questions to Explore", "Areas for Research", "Action Items"}},
        }});

    catalog.registerTemplate("goal-planning", {
        "Goal Achievement", "Goal Setting", {
            {"Vision", {"Long-term Goals", "Life Vision", "Ultimate Objectives", "Dream Outcomes"}},
            {"Strategy", {"Action Plans", "Resource Requirements", "Timeline Planning", "Milestone Setting"}},
            {"Motivation", {"Why Important", "Personal Drivers", "Inspiration Sources", "Accountability Partners"}},
            {"Tracking", {"Progress Metrics", "Check-in Schedule", "Adjustment Points", "Success Indicators"}},
        }});

    return catalog;
}

void TemplateCatalog::registerTemplate(const std::string& key, TemplateSpec spec) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&key](const Entry& e) { return e.key == key; });
    if (it != entries_.end()) {
        it->spec = std::move(spec);
        return;
    }
    entries_.push_back({key, std::move(spec)});
}

const TemplateSpec* TemplateCatalog::find(const std::string& key) const {
    for (const auto& entry : entries_) {
        if (entry.key == key) {
            return &entry.spec;
        }
    }
    return nullptr;
}

std::vector<std::string> TemplateCatalog::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.key);
    }
    return result;
}

}  // namespace mindgraph
